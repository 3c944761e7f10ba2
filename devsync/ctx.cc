// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

decltype(devsync::ctx::log)
devsync::ctx::log
{
	"ctx", 'c'
};

//
// pool
//

devsync::ctx::pool::pool(const string_view &name,
                         const size_t &size)
:name{name}
,threads
{
	std::make_unique<boost::asio::thread_pool>(std::max(size, 1UL))
}
,count
{
	std::max(size, 1UL)
}
{
	log::debug
	{
		log, "pool:%s started with %lu threads", this->name, count
	};
}

devsync::ctx::pool::~pool()
noexcept
{
	join();
}

void
devsync::ctx::pool::join()
noexcept
{
	if(!threads)
		return;

	// Without a prior stop() this drains all outstanding work first.
	threads->join();
	threads.reset();
	log::debug
	{
		log, "pool:%s joined after %lu tasks", name, completed()
	};
}

void
devsync::ctx::pool::wait()
{
	std::unique_lock<std::mutex> lock
	{
		mutex
	};

	dock.wait(lock, [this]
	{
		return pending == 0;
	});
}

void
devsync::ctx::pool::operator()(closure func)
{
	assert(threads);
	{
		const std::lock_guard<std::mutex> lock
		{
			mutex
		};

		++pending;
	}

	boost::asio::post(*threads, [this, func(std::move(func))]
	{
		try
		{
			func();
		}
		catch(const std::exception &e)
		{
			log::error
			{
				log, "pool:%s task :%s", name, e.what()
			};
		}

		finished();
	});
}

void
devsync::ctx::pool::finished()
noexcept
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	assert(pending > 0);
	--pending;
	++done;
	dock.notify_all();
}

size_t
devsync::ctx::pool::queued()
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return pending;
}

size_t
devsync::ctx::pool::completed()
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return done;
}
