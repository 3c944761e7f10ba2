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
#define HAVE_DEVSYNC_M_NOTIFIER_H

namespace devsync::m
{
	struct notifier;
}

/// Wakes local clients waiting on a stream. Called after the position has
/// been persisted and retired, so a woken client can read up to it.
struct devsync::m::notifier
{
	virtual void on_new_event(const string_view &kind, const uint64_t &position, const std::set<std::string> &room_ids) = 0;

	virtual ~notifier() noexcept = default;
};
