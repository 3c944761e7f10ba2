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
#define HAVE_DEVSYNC_M_STORE_H

namespace devsync::m
{
	struct store;
}

/// Persistence interface. Every call may block. Implementations report a
/// missing row with store::not_found and any other failure with store::error.
///
/// Access token revocation lives here as well; there is no separate
/// authentication store.
///
struct devsync::m::store
{
	DEVSYNC_EXCEPTION(devsync::error, error)
	DEVSYNC_EXCEPTION(error, not_found)

	using device_ids = std::vector<std::string>;
	using hosts = std::set<std::string>;
	using user_ids = std::set<std::string>;
	using room_ids = std::set<std::string>;

	/// device_id => serialized json object as received from the origin
	using cached_devices = std::map<std::string, std::string>;

	/// device_id => last recorded connection
	using client_ips = std::map<std::string, client_ip>;

	/// Stream position and a serialized json array of the user's devices
	/// with their keys attached.
	using devices_with_keys = std::pair<uint64_t, std::string>;

	// Local devices; store_device() returns true if the row was created and
	// false if the device already existed (which is left as it was).
	virtual bool store_device(const string_view &user_id, const string_view &device_id, const std::optional<std::string> &display_name) = 0;
	virtual device get_device(const string_view &user_id, const string_view &device_id) = 0;
	virtual std::vector<device> get_devices_by_user(const string_view &user_id) = 0;
	virtual void update_device(const string_view &user_id, const string_view &device_id, const std::optional<std::string> &display_name) = 0;
	virtual void delete_device(const string_view &user_id, const string_view &device_id) = 0;
	virtual void delete_keys_by_device(const string_view &user_id, const string_view &device_id) = 0;
	virtual void user_delete_access_tokens(const string_view &user_id, const string_view &device_id) = 0;
	virtual client_ips get_last_client_ip_by_device(const string_view &user_id, const device_ids &) = 0;
	virtual devices_with_keys get_devices_with_keys_by_user(const string_view &user_id) = 0;

	// Device list stream
	virtual uint64_t get_device_stream_token() = 0;
	virtual void add_device_change_to_streams(const uint64_t &position, const string_view &user_id, const device_ids &, const hosts &) = 0;
	virtual user_ids get_user_whose_devices_changed(const uint64_t &from, const uint64_t &to) = 0;
	virtual room_ids get_rooms_for_user(const string_view &user_id) = 0;

	// Cache of remote device lists
	virtual std::optional<std::string> get_device_list_remote_extremity(const string_view &user_id) = 0;
	virtual cached_devices get_cached_devices_for_user(const string_view &user_id) = 0;
	virtual void update_remote_device_list_cache(const string_view &user_id, const cached_devices &, const string_view &stream_id) = 0;
	virtual void update_remote_device_list_cache_entry(const string_view &user_id, const string_view &device_id, const string_view &content, const string_view &stream_id) = 0;
	virtual void delete_remote_device_list_cache_entry(const string_view &user_id, const string_view &device_id, const string_view &stream_id) = 0;

	virtual ~store() noexcept = default;
};
