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
#define HAVE_DEVSYNC_CTX_LINEARIZER_H

namespace devsync::ctx
{
	template<class key,
	         class compare = std::less<key>>
	class linearizer;
}

/// Keyed mutual exclusion with strict arrival order.
///
/// acquire(k) returns a scoped lock; at most one lock per key exists at a
/// time and waiters for the same key are granted the slot in the order they
/// called acquire(). Distinct keys never block each other. A key occupies
/// the map only while it is held or awaited.
///
/// Each queue hands out tickets; the holder is the ticket being served.
/// reserve(k) takes a ticket without waiting for it, so a place in line can
/// be claimed on one thread and waited for on another with lock::wait().
///
template<class key,
         class compare>
class devsync::ctx::linearizer
{
	struct queue
	{
		std::condition_variable cond;
		uint64_t ticket {0};
		uint64_t serving {0};
		size_t refs {0};
	};

	using map = std::map<key, queue, compare>;

	mutable std::mutex mutex;
	map queues;

	void wait(const typename map::iterator &, const uint64_t &ticket);
	void release(const typename map::iterator &) noexcept;

  public:
	class lock;

	size_t size() const;
	size_t waiting(const key &) const;
	bool locked(const key &) const;

	lock reserve(const key &);
	lock acquire(const key &);

	linearizer() = default;
	linearizer(linearizer &&) = delete;
	linearizer(const linearizer &) = delete;
	linearizer &operator=(linearizer &&) = delete;
	linearizer &operator=(const linearizer &) = delete;
	~linearizer() noexcept;
};

/// Proof of holding the slot for one key, or of a place in line for it
/// until wait() returns. Released on destruction or by unlock(); a ticket
/// which was never waited for still waits its turn before passing it on.
/// Movable so the slot can be carried out of a scope.
template<class key,
         class compare>
class devsync::ctx::linearizer<key, compare>::lock
{
	friend class linearizer;

	linearizer *l {nullptr};
	typename map::iterator it;
	uint64_t ticket {0};
	bool held {false};

	lock(linearizer &, const typename map::iterator &, const uint64_t &ticket) noexcept;

  public:
	explicit operator bool() const noexcept      { return l != nullptr && held;                     }
	bool pending() const noexcept                { return l != nullptr && !held;                    }
	const key &id() const noexcept               { assert(l); return it->first;                     }

	void wait();
	void unlock() noexcept;

	lock() = default;
	lock(lock &&) noexcept;
	lock(const lock &) = delete;
	lock &operator=(lock &&) noexcept;
	lock &operator=(const lock &) = delete;
	~lock() noexcept;
};

template<class key,
         class compare>
devsync::ctx::linearizer<key, compare>::~linearizer()
noexcept
{
	assert(queues.empty());
}

template<class key,
         class compare>
typename devsync::ctx::linearizer<key, compare>::lock
devsync::ctx::linearizer<key, compare>::acquire(const key &k)
{
	auto ret
	{
		reserve(k)
	};

	ret.wait();
	return ret;
}

template<class key,
         class compare>
typename devsync::ctx::linearizer<key, compare>::lock
devsync::ctx::linearizer<key, compare>::reserve(const key &k)
{
	const std::lock_guard<std::mutex> lg
	{
		mutex
	};

	const auto it
	{
		queues.try_emplace(k).first
	};

	auto &q(it->second);
	++q.refs;
	return lock
	{
		*this, it, q.ticket++
	};
}

template<class key,
         class compare>
void
devsync::ctx::linearizer<key, compare>::wait(const typename map::iterator &it,
                                             const uint64_t &ticket)
{
	std::unique_lock<std::mutex> ul
	{
		mutex
	};

	auto &q(it->second);
	q.cond.wait(ul, [&q, &ticket]
	{
		return q.serving == ticket;
	});
}

template<class key,
         class compare>
void
devsync::ctx::linearizer<key, compare>::release(const typename map::iterator &it)
noexcept
{
	const std::lock_guard<std::mutex> lg
	{
		mutex
	};

	auto &q(it->second);
	assert(q.refs > 0);
	assert(q.serving < q.ticket);
	++q.serving;
	if(--q.refs == 0)
	{
		queues.erase(it);
		return;
	}

	// Every waiter rechecks its ticket; only the next one proceeds.
	q.cond.notify_all();
}

template<class key,
         class compare>
bool
devsync::ctx::linearizer<key, compare>::locked(const key &k)
const
{
	const std::lock_guard<std::mutex> lg
	{
		mutex
	};

	return queues.count(k) > 0;
}

template<class key,
         class compare>
size_t
devsync::ctx::linearizer<key, compare>::waiting(const key &k)
const
{
	const std::lock_guard<std::mutex> lg
	{
		mutex
	};

	const auto it
	{
		queues.find(k)
	};

	if(it == end(queues))
		return 0;

	const auto &q(it->second);
	return q.ticket - q.serving - 1;
}

template<class key,
         class compare>
size_t
devsync::ctx::linearizer<key, compare>::size()
const
{
	const std::lock_guard<std::mutex> lg
	{
		mutex
	};

	return queues.size();
}

//
// lock
//

template<class key,
         class compare>
devsync::ctx::linearizer<key, compare>::lock::lock(linearizer &l,
                                                   const typename map::iterator &it,
                                                   const uint64_t &ticket)
noexcept
:l{&l}
,it{it}
,ticket{ticket}
{}

template<class key,
         class compare>
devsync::ctx::linearizer<key, compare>::lock::lock(lock &&o)
noexcept
:l{std::move(o.l)}
,it{std::move(o.it)}
,ticket{o.ticket}
,held{o.held}
{
	o.l = nullptr;
	o.held = false;
}

template<class key,
         class compare>
typename devsync::ctx::linearizer<key, compare>::lock &
devsync::ctx::linearizer<key, compare>::lock::operator=(lock &&o)
noexcept
{
	unlock();
	l = std::move(o.l);
	it = std::move(o.it);
	ticket = o.ticket;
	held = o.held;
	o.l = nullptr;
	o.held = false;
	return *this;
}

template<class key,
         class compare>
devsync::ctx::linearizer<key, compare>::lock::~lock()
noexcept
{
	unlock();
}

template<class key,
         class compare>
void
devsync::ctx::linearizer<key, compare>::lock::wait()
{
	assert(l);
	if(held)
		return;

	l->wait(it, ticket);
	held = true;
}

template<class key,
         class compare>
void
devsync::ctx::linearizer<key, compare>::lock::unlock()
noexcept
{
	if(!l)
		return;

	if(!held)
		l->wait(it, ticket);

	l->release(it);
	l = nullptr;
	held = false;
}
