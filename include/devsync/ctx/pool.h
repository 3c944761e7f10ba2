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
#define HAVE_DEVSYNC_CTX_POOL_H

namespace boost::asio
{
	class thread_pool;
}

namespace devsync::ctx
{
	struct pool;
}

/// A fixed set of worker threads fed from one queue. Closures run in the
/// order posted, concurrently up to the size of the pool. An exception
/// escaping a closure is logged and dropped; the closure is the place to
/// handle it.
struct devsync::ctx::pool
{
	using closure = std::function<void ()>;

	std::string name;
	std::unique_ptr<boost::asio::thread_pool> threads;
	size_t count {0};

	mutable std::mutex mutex;
	std::condition_variable dock;
	size_t pending {0};
	size_t done {0};

	void finished() noexcept;

  public:
	size_t size() const noexcept                 { return count;                                    }
	size_t queued() const;
	size_t completed() const;

	void operator()(closure);
	void wait();
	void join() noexcept;

	pool(const string_view &name, const size_t &size);
	pool(pool &&) = delete;
	pool(const pool &) = delete;
	~pool() noexcept;
};
