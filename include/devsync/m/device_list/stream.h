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
#define HAVE_DEVSYNC_M_DEVICE_LIST_STREAM_H

/// Allocator of positions on the device list stream.
///
/// Positions are unique and strictly increasing for the life of the
/// process; the first one follows the highest position already persisted.
/// A position is retired when its holder is done with it, whether the write
/// it stands for succeeded or not. Positions are not necessarily retired in
/// order, so current() is the highest position below which everything has
/// been retired; readers which stop there never step over a write still in
/// flight.
///
struct devsync::m::device_list::stream
{
	struct position;

	mutable std::mutex mutex;
	uint64_t head {0};
	std::set<uint64_t> pending;

	void retire(const uint64_t &) noexcept;

  public:
	uint64_t current() const;
	uint64_t last() const;
	size_t inflight() const;

	position allocate_next();

	explicit stream(const uint64_t &start = 0);
	stream(stream &&) = delete;
	stream(const stream &) = delete;
	~stream() noexcept;
};

/// An allocated position; retires on destruction.
struct devsync::m::device_list::stream::position
{
	stream *s {nullptr};
	uint64_t id {0};

  public:
	operator const uint64_t &() const noexcept   { return id;                                       }

	void retire() noexcept;

	position(stream &, const uint64_t &id) noexcept;
	position(position &&) noexcept;
	position(const position &) = delete;
	position &operator=(position &&) noexcept;
	position &operator=(const position &) = delete;
	~position() noexcept;
};
