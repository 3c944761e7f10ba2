// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#pragma once
#define HAVE_DEVSYNC_M_FED_H

/// Federation Interface
namespace devsync::m::fed
{
	struct transport;
	struct dispatcher;

	DEVSYNC_EXCEPTION(devsync::error, error)
	DEVSYNC_EXCEPTION(error, timeout)
	DEVSYNC_EXCEPTION(error, bad_response)

	extern log::log log;
}

/// The transport between this server and its peers. Outbound requests block
/// the caller until the peer answers, the timeout passes (fed::timeout) or
/// the exchange fails (fed::error). Inbound traffic is routed to handlers
/// registered by type.
struct devsync::m::fed::transport
{
	/// The part of handling an EDU which may be deferred. It owns whatever
	/// it needs from the EDU.
	using edu_task = std::function<void ()>;

	/// Receives the origin server name and the EDU's content object on the
	/// receiving thread, in arrival order. Whatever must be decided in that
	/// order is done here; the rest is returned as the task, or nothing.
	using edu_handler = std::function<edu_task (const string_view &origin, const string_view &content)>;

	/// Receives the query's arguments object; returns the response object.
	using query_handler = std::function<std::string (const string_view &args)>;

	virtual void register_edu_handler(const string_view &type, edu_handler) = 0;
	virtual void unregister_edu_handler(const string_view &type) = 0;
	virtual void register_query_handler(const string_view &type, query_handler) = 0;
	virtual void unregister_query_handler(const string_view &type) = 0;

	/// Wake the outbound queue for host; delivery and retry are internal to
	/// the transport. Nothing is carried with the poke.
	virtual void send_device_messages(const string_view &host) = 0;

	/// GET /_matrix/federation/v1/user/devices/{user_id} on origin; returns
	/// the response body.
	virtual std::string query_user_devices(const string_view &origin, const string_view &user_id, const milliseconds &timeout) = 0;

	virtual ~transport() noexcept = default;
};

/// Inbound half of a transport: the handler registry and the dispatch of
/// received EDUs and queries to it. A concrete transport derives from this
/// and supplies the outbound calls.
///
/// The handler itself always runs on the receiving thread and a failure
/// there reaches the receiver. The task it returns runs right after it
/// unless the dispatcher was constructed with async, in which case it is
/// posted to a pool and a failure is logged there instead.
///
struct devsync::m::fed::dispatcher
:transport
{
	DEVSYNC_OVERLOAD(async)

	static conf::item<uint64_t> pool_size;

	mutable std::mutex mutex;
	std::map<std::string, edu_handler, std::less<>> edus;
	std::map<std::string, query_handler, std::less<>> queries;
	std::unique_ptr<ctx::pool> pool;

	edu_handler edu(const string_view &type) const;
	query_handler query(const string_view &type) const;

  public:
	void register_edu_handler(const string_view &type, edu_handler) override;
	void unregister_edu_handler(const string_view &type) override;
	void register_query_handler(const string_view &type, query_handler) override;
	void unregister_query_handler(const string_view &type) override;

	bool handles_edu(const string_view &type) const;
	bool handles_query(const string_view &type) const;

	// Inbound
	void on_edu(const string_view &origin, const string_view &type, const string_view &content);
	std::string on_query(const string_view &type, const string_view &args);

	// Block until every posted EDU has been handled.
	void wait();

	dispatcher(async_t);
	dispatcher();
	~dispatcher() noexcept override;
};
