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
#define HAVE_DEVSYNC_M_STATE_H

namespace devsync::m
{
	struct state;
}

/// Room state as far as device lists care about it: who is in the room now.
struct devsync::m::state
{
	virtual std::set<std::string> get_current_users_in_room(const string_view &room_id) = 0;

	virtual ~state() noexcept = default;
};
