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
#define HAVE_DEVSYNC_M_DEVICE_H

namespace devsync::m
{
	struct device;
	struct client_ip;
}

/// A device registered by a local user.
struct devsync::m::device
{
	/// The user the device belongs to.
	std::string user_id;

	/// Unique for the user.
	std::string device_id;

	/// Display name set by the user for this device. Absent if no name has
	/// been set.
	std::optional<std::string> display_name;

	/// Milliseconds since the epoch when the device was first registered.
	time_t created_at {0};

	/// The IP address where this device was last seen. (May be a few minutes
	/// out of date, for efficiency reasons).
	std::optional<std::string> last_seen_ip;

	/// The timestamp (in milliseconds since the unix epoch) when this device
	/// was last seen.
	std::optional<time_t> last_seen_ts;
};

/// Last client connection recorded for a device.
struct devsync::m::client_ip
{
	std::string ip;
	time_t last_seen {0};
};
