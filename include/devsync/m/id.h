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
#define HAVE_DEVSYNC_M_ID_H

/// Matrix identifiers. Only the forms this library handles are modeled: a
/// user ID is '@' localpart ':' server name, and the server name is the
/// domain of authority for the user.
namespace devsync::m::id
{
	struct user;

	DEVSYNC_M_EXCEPTION(m::error, INVALID_MXID, http::BAD_REQUEST)

	bool valid_user(const string_view &) noexcept;
}

namespace devsync::m
{
	// The user belongs to the homeserver named by origin.
	bool my(const id::user &, const string_view &origin) noexcept;
}

/// View over a user ID; validated at construction.
struct devsync::m::id::user
{
	string_view id;

	operator const string_view &() const noexcept      { return id;                                  }
	string_view local() const noexcept;
	string_view host() const noexcept;

	user(const string_view &id);
};
