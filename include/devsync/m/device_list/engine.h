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
#define HAVE_DEVSYNC_M_DEVICE_LIST_ENGINE_H

/// Federation side of the device list protocol.
///
/// The engine registers itself with the transport for the
/// m.device_list_update EDU and the user_devices query for its lifetime.
/// Updates for the same user are applied one at a time in the order they
/// arrived; updates for different users run concurrently.
///
struct devsync::m::device_list::engine
{
	enum result :uint8_t;

	static conf::item<milliseconds> resync_timeout;

	std::string origin;
	m::store &store;
	fed::transport &transport;
	device_list::changes &changes;
	device_list::cache cache;
	device_list::cache::linearizer linearizer;

	std::optional<update> admit(const string_view &origin, const string_view &content) const;
	bool incremental(const update &, const device_list::cache::lock &) const;
	result apply(const update &, const device_list::cache::lock &);
	result resync(const string_view &origin, const device_list::cache::lock &);
	result process(const string_view &origin, const update &, const device_list::cache::lock &);

  public:
	/// Apply an m.device_list_update from origin. Protocol violations are
	/// logged and IGNORED; a failure to resync throws and leaves the cache
	/// as it was.
	result handle(const string_view &origin, const string_view &content);

	/// Replace the cached list of a remote user with the origin's.
	void resync(const string_view &origin, const string_view &user_id);

	/// Answer a user_devices query for one of our own users.
	json::strung query(const string_view &user_id) const;

	engine(const string_view &origin,
	       m::store &,
	       fed::transport &,
	       device_list::changes &);

	engine(engine &&) = delete;
	engine(const engine &) = delete;
	~engine() noexcept;
};

enum devsync::m::device_list::engine::result
:uint8_t
{
	IGNORED      = 0,  ///< Protocol violation; nothing was done.
	INCREMENTAL  = 1,  ///< The single device in the update was applied.
	RESYNC       = 2,  ///< The whole list was fetched from the origin.
};

namespace devsync::m::device_list
{
	string_view reflect(const engine::result &) noexcept;
}
