// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

//
// stream
//

devsync::m::device_list::stream::stream(const uint64_t &start)
:head{start}
{
}

devsync::m::device_list::stream::~stream()
noexcept
{
	assert(pending.empty());
}

devsync::m::device_list::stream::position
devsync::m::device_list::stream::allocate_next()
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto id
	{
		++head
	};

	pending.emplace(id);
	return position
	{
		*this, id
	};
}

void
devsync::m::device_list::stream::retire(const uint64_t &id)
noexcept
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	assert(pending.count(id));
	pending.erase(id);
}

uint64_t
devsync::m::device_list::stream::current()
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return pending.empty()?
		head:
		*begin(pending) - 1;
}

uint64_t
devsync::m::device_list::stream::last()
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return head;
}

size_t
devsync::m::device_list::stream::inflight()
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return pending.size();
}

//
// stream::position
//

devsync::m::device_list::stream::position::position(stream &s,
                                                    const uint64_t &id)
noexcept
:s{&s}
,id{id}
{
}

devsync::m::device_list::stream::position::position(position &&o)
noexcept
:s{std::move(o.s)}
,id{std::move(o.id)}
{
	o.s = nullptr;
}

devsync::m::device_list::stream::position &
devsync::m::device_list::stream::position::operator=(position &&o)
noexcept
{
	retire();
	s = std::move(o.s);
	id = std::move(o.id);
	o.s = nullptr;
	return *this;
}

devsync::m::device_list::stream::position::~position()
noexcept
{
	retire();
}

void
devsync::m::device_list::stream::position::retire()
noexcept
{
	if(!s)
		return;

	s->retire(id);
	s = nullptr;
}
