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
#define HAVE_DEVSYNC_M_DEVICE_LIST_H

/// Device list synchronization between servers.
///
/// A server is authoritative for the device lists of its own users. Every
/// change to one is assigned a position on a local stream and the servers
/// sharing a room with the user are poked; they pull it from our outbound
/// queue. The update names the previous stream_id of the user on our side
/// (prev_id); a receiver holding exactly that as its extremity applies the
/// update incrementally, anything else makes it fetch the whole list.
///
namespace devsync::m::device_list
{
	struct update;
	struct stream;
	struct cache;
	struct changes;
	struct engine;

	extern log::log log;
}

/// An m.device_list_update EDU's content. Construction validates the
/// envelope and throws m::BAD_JSON if it is violated.
struct devsync::m::device_list::update
{
	std::string user_id;
	std::string device_id;
	std::string stream_id;
	std::vector<std::string> prev_id;
	bool deleted {false};

	/// The content minus the envelope (user_id, device_id, stream_id and
	/// prev_id); this is what gets cached for the device. A deleted key
	/// stays in it as sent.
	json::strung content;

	update(const string_view &content);
};

#include "stream.h"
#include "cache.h"
#include "changes.h"
#include "engine.h"
