// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(devsync::m::fed::dispatcher::pool_size)
devsync::m::fed::dispatcher::pool_size
{
	{ "name",     "devsync.m.fed.dispatcher.pool.size" },
	{ "default",  4L                                   },
};

//
// dispatcher::dispatcher
//

devsync::m::fed::dispatcher::dispatcher()
{
}

devsync::m::fed::dispatcher::dispatcher(async_t)
:pool
{
	std::make_unique<ctx::pool>("fed.dispatcher", size_t(pool_size))
}
{
}

devsync::m::fed::dispatcher::~dispatcher()
noexcept
{
	// Handlers may still be referenced by posted EDUs; drain before the
	// registry goes away.
	if(pool)
		pool->join();
}

void
devsync::m::fed::dispatcher::wait()
{
	if(pool)
		pool->wait();
}

void
devsync::m::fed::dispatcher::on_edu(const string_view &origin,
                                    const string_view &type,
                                    const string_view &content)
{
	auto handler
	{
		edu(type)
	};

	if(!handler)
	{
		log::dwarning
		{
			log, "Unhandled EDU '%s' from %s", type, origin
		};

		return;
	}

	auto task
	{
		handler(origin, content)
	};

	if(!task)
		return;

	if(!pool)
	{
		task();
		return;
	}

	(*pool)([task(std::move(task)), origin(std::string(origin)), type(std::string(type))]
	{
		try
		{
			task();
		}
		catch(const std::exception &e)
		{
			log::error
			{
				log, "EDU '%s' from %s :%s", type, origin, e.what()
			};
		}
	});
}

std::string
devsync::m::fed::dispatcher::on_query(const string_view &type,
                                      const string_view &args)
{
	const auto handler
	{
		query(type)
	};

	if(!handler)
		throw m::NOT_FOUND
		{
			"No handler for query type '%s'", type
		};

	return handler(args);
}

bool
devsync::m::fed::dispatcher::handles_edu(const string_view &type)
const
{
	return bool(edu(type));
}

bool
devsync::m::fed::dispatcher::handles_query(const string_view &type)
const
{
	return bool(query(type));
}

devsync::m::fed::transport::edu_handler
devsync::m::fed::dispatcher::edu(const string_view &type)
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto it(edus.find(type));
	return it != end(edus)? it->second : edu_handler{};
}

devsync::m::fed::transport::query_handler
devsync::m::fed::dispatcher::query(const string_view &type)
const
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto it(queries.find(type));
	return it != end(queries)? it->second : query_handler{};
}

void
devsync::m::fed::dispatcher::register_edu_handler(const string_view &type,
                                                  edu_handler handler)
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto iit
	{
		edus.emplace(std::string(type), std::move(handler))
	};

	if(!iit.second)
		throw fed::error
		{
			"An EDU handler for '%s' is already registered", type
		};
}

void
devsync::m::fed::dispatcher::unregister_edu_handler(const string_view &type)
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto it(edus.find(type));
	if(it != end(edus))
		edus.erase(it);
}

void
devsync::m::fed::dispatcher::register_query_handler(const string_view &type,
                                                    query_handler handler)
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto iit
	{
		queries.emplace(std::string(type), std::move(handler))
	};

	if(!iit.second)
		throw fed::error
		{
			"A query handler for '%s' is already registered", type
		};
}

void
devsync::m::fed::dispatcher::unregister_query_handler(const string_view &type)
{
	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	const auto it(queries.find(type));
	if(it != end(queries))
		queries.erase(it);
}
