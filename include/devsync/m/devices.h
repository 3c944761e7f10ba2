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
#define HAVE_DEVSYNC_M_DEVICES_H

namespace devsync::m
{
	struct devices;

	DEVSYNC_M_EXCEPTION(error, ALLOCATION_EXHAUSTED, http::INTERNAL_SERVER_ERROR)
}

/// Registry of the devices of our own users. Every change which creates,
/// renames or removes a device is announced through device_list::changes.
struct devsync::m::devices
{
	static conf::item<uint64_t> id_attempts;
	static conf::item<uint64_t> id_length;

	m::store &store;
	device_list::changes &changes;

	std::string generate() const;
	void last_seen(const string_view &user_id, std::vector<device> &) const;

  public:
	/// Registers device_id for the user if it isn't already; returns it.
	/// Without a device_id a fresh one is generated and retried on
	/// collision until id_attempts is reached (ALLOCATION_EXHAUSTED).
	std::string add(const string_view &user_id,
	                const std::optional<string_view> &device_id = std::nullopt,
	                const std::optional<string_view> &display_name = std::nullopt);

	device get(const string_view &user_id, const string_view &device_id) const;
	std::vector<device> list(const string_view &user_id) const;
	void update(const string_view &user_id, const string_view &device_id, const std::optional<string_view> &display_name);

	/// Deleting a device which does not exist is not an error.
	void del(const string_view &user_id, const string_view &device_id);

	devices(m::store &, device_list::changes &);
};
