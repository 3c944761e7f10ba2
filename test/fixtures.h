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
#define HAVE_DEVSYNC_TEST_FIXTURES_H

#include <devsync/matrix.h>

/// In-memory collaborators for the matrix layer. Each is safe to call from
/// several threads and records what was asked of it.
namespace devsync::test
{
	struct store;
	struct state;
	struct notifier;
	struct transport;
	struct env;

	using key = std::pair<std::string, std::string>;  // user_id, device_id

	extern const std::string origin;
}

struct devsync::test::store
:m::store
{
	struct change
	{
		uint64_t position;
		std::string user_id;
		m::store::device_ids device_ids;
		m::store::hosts hosts;
	};

	struct remote
	{
		std::optional<std::string> extremity;
		cached_devices devices;
	};

	mutable std::mutex mutex;
	std::map<key, m::device> devices;
	std::set<key> keys;
	std::map<key, size_t> tokens;
	std::map<key, m::client_ip> ips;
	std::map<std::string, room_ids> rooms;
	std::map<std::string, devices_with_keys> with_keys;
	std::map<std::string, remote> remotes;
	std::vector<change> changes;
	std::vector<std::string> calls;
	uint64_t stream_token {0};

	// Failure injection
	size_t collisions {0};          // next store_device calls report an existing device
	bool fail_tokens {false};       // user_delete_access_tokens throws
	bool fail_changes {false};      // add_device_change_to_streams throws

	void call(const string_view &name);

  public:
	bool store_device(const string_view &user_id, const string_view &device_id, const std::optional<std::string> &display_name) override;
	m::device get_device(const string_view &user_id, const string_view &device_id) override;
	std::vector<m::device> get_devices_by_user(const string_view &user_id) override;
	void update_device(const string_view &user_id, const string_view &device_id, const std::optional<std::string> &display_name) override;
	void delete_device(const string_view &user_id, const string_view &device_id) override;
	void delete_keys_by_device(const string_view &user_id, const string_view &device_id) override;
	void user_delete_access_tokens(const string_view &user_id, const string_view &device_id) override;
	client_ips get_last_client_ip_by_device(const string_view &user_id, const device_ids &) override;
	devices_with_keys get_devices_with_keys_by_user(const string_view &user_id) override;
	uint64_t get_device_stream_token() override;
	void add_device_change_to_streams(const uint64_t &position, const string_view &user_id, const device_ids &, const hosts &) override;
	user_ids get_user_whose_devices_changed(const uint64_t &from, const uint64_t &to) override;
	room_ids get_rooms_for_user(const string_view &user_id) override;
	std::optional<std::string> get_device_list_remote_extremity(const string_view &user_id) override;
	cached_devices get_cached_devices_for_user(const string_view &user_id) override;
	void update_remote_device_list_cache(const string_view &user_id, const cached_devices &, const string_view &stream_id) override;
	void update_remote_device_list_cache_entry(const string_view &user_id, const string_view &device_id, const string_view &content, const string_view &stream_id) override;
	void delete_remote_device_list_cache_entry(const string_view &user_id, const string_view &device_id, const string_view &stream_id) override;

	// Test helpers
	void join(const string_view &user_id, const string_view &room_id);
	std::vector<std::string> calls_since(const size_t &) const;
	std::vector<change> changes_copy() const;
	size_t count_changes() const;
};

struct devsync::test::state
:m::state
{
	mutable std::mutex mutex;
	std::map<std::string, std::set<std::string>> members;

  public:
	std::set<std::string> get_current_users_in_room(const string_view &room_id) override;

	void join(const string_view &user_id, const string_view &room_id);
};

struct devsync::test::notifier
:m::notifier
{
	struct event
	{
		std::string kind;
		uint64_t position;
		std::set<std::string> room_ids;
	};

	mutable std::mutex mutex;
	std::vector<event> events;

  public:
	void on_new_event(const string_view &kind, const uint64_t &position, const std::set<std::string> &room_ids) override;

	std::vector<event> events_copy() const;
};

/// Scripted peer. Answers user_devices queries from `responses`; a user in
/// `timeouts` gets a fed::timeout instead. While the gate is closed queries
/// block after announcing themselves in `entered`.
struct devsync::test::transport
:m::fed::dispatcher
{
	mutable std::mutex mutex;
	std::condition_variable cond;
	std::map<std::string, std::string> responses;
	std::set<std::string> timeouts;
	std::set<std::string> unreachable;            // pokes to these hosts throw
	std::map<std::string, size_t> queries;
	std::vector<std::string> pokes;
	std::vector<std::string> order;               // user_id of each query, in order of arrival
	milliseconds last_timeout {0};
	size_t entered {0};
	bool open {true};

  public:
	void send_device_messages(const string_view &host) override;
	std::string query_user_devices(const string_view &origin, const string_view &user_id, const milliseconds &timeout) override;

	// Test helpers
	void respond(const string_view &user_id, const string_view &response);
	size_t query_count(const string_view &user_id) const;
	std::vector<std::string> pokes_copy() const;
	void close();
	void release();
	bool wait_entered(const size_t &n, const milliseconds &timeout = milliseconds(5000));

	using m::fed::dispatcher::dispatcher;
};

/// A local server wired from the fakes above.
struct devsync::test::env
{
	test::store store;
	test::state state;
	test::notifier notifier;
	test::transport transport;
	m::device_list::changes changes
	{
		origin, store, state, notifier, transport
	};

	m::devices devices
	{
		store, changes
	};

	m::device_list::engine engine
	{
		origin, store, transport, changes
	};

	// Put a user in a room as far as both the store and the state know.
	void join(const string_view &user_id, const string_view &room_id);

	env() = default;
	env(m::fed::dispatcher::async_t);
};
