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
#define HAVE_DEVSYNC_M_DEVICE_LIST_CACHE_H

/// Our copy of the device lists of remote users.
///
/// An entry is the extremity (the last stream_id of the origin we have
/// applied) and the devices as the origin described them. Every write takes
/// the linearizer lock of the user as proof that the caller is the only
/// writer for that user; the user is the lock's key.
///
struct devsync::m::device_list::cache
{
	using linearizer = ctx::linearizer<std::string>;
	using lock = linearizer::lock;
	using devices = m::store::cached_devices;

	m::store &store;

  public:
	std::optional<std::string> extremity(const string_view &user_id) const;
	devices get(const string_view &user_id) const;

	void replace(const lock &, const devices &, const string_view &stream_id);
	void set(const lock &, const string_view &device_id, const string_view &content, const string_view &stream_id);
	void del(const lock &, const string_view &device_id, const string_view &stream_id);

	cache(m::store &);
};
