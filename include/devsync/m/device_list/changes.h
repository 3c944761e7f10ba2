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
#define HAVE_DEVSYNC_M_DEVICE_LIST_CHANGES_H

/// Records device list changes and fans them out.
///
/// notify() allocates the next stream position for a change, persists it
/// with the hosts which have to hear about it, wakes local clients and pokes
/// those hosts. Only changes to our own users reach other servers; a change
/// to a remote user's cached list is only of local interest.
///
struct devsync::m::device_list::changes
{
	using device_ids = m::store::device_ids;
	using room_ids = m::store::room_ids;
	using user_ids = m::store::user_ids;
	using hosts = m::store::hosts;

	std::string origin;
	m::store &store;
	m::state &state;
	m::notifier &notifier;
	fed::transport &transport;
	device_list::stream stream;

  public:
	/// Servers other than ours with a member in any of the rooms.
	hosts interested(const room_ids &) const;

	/// Last position readers may consume up to.
	uint64_t current() const;

	/// Users whose devices changed after position `from` who share one of
	/// the rooms. Each user appears once.
	user_ids since(const room_ids &, const uint64_t &from) const;

	uint64_t notify(const string_view &user_id, const device_ids &);

	changes(const string_view &origin,
	        m::store &,
	        m::state &,
	        m::notifier &,
	        fed::transport &);
};
