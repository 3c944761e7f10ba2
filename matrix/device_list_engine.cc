// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(devsync::m::device_list::engine::resync_timeout)
devsync::m::device_list::engine::resync_timeout
{
	{ "name",     "devsync.m.device_list.resync.timeout" },
	{ "default",  10000L                                 },
};

devsync::m::device_list::engine::engine(const string_view &origin,
                                        m::store &store,
                                        fed::transport &transport,
                                        device_list::changes &changes)
:origin{origin}
,store{store}
,transport{transport}
,changes{changes}
,cache{store}
{
	transport.register_edu_handler("m.device_list_update", [this]
	(const string_view &origin, const string_view &content) -> fed::transport::edu_task
	{
		auto edu
		{
			admit(origin, content)
		};

		if(!edu)
			return {};

		// The place in line is taken on the receiving thread so updates for
		// a user are applied in the order they arrived wherever the task runs.
		auto lock
		{
			std::make_shared<device_list::cache::lock>(linearizer.reserve(edu->user_id))
		};

		return [this, origin(std::string(origin)), edu(std::move(*edu)), lock(std::move(lock))]
		{
			lock->wait();
			process(origin, edu, *lock);
		};
	});

	try
	{
		transport.register_query_handler("user_devices", [this]
		(const string_view &args) -> std::string
		{
			const json::object object
			{
				args
			};

			return query(json::string(object.at("user_id")));
		});
	}
	catch(...)
	{
		transport.unregister_edu_handler("m.device_list_update");
		throw;
	}
}

devsync::m::device_list::engine::~engine()
noexcept
{
	transport.unregister_query_handler("user_devices");
	transport.unregister_edu_handler("m.device_list_update");
}

devsync::m::device_list::engine::result
devsync::m::device_list::engine::handle(const string_view &origin,
                                        const string_view &content)
{
	const auto edu
	{
		admit(origin, content)
	};

	if(!edu)
		return IGNORED;

	const auto lock
	{
		linearizer.acquire(edu->user_id)
	};

	return process(origin, *edu, lock);
}

std::optional<devsync::m::device_list::update>
devsync::m::device_list::engine::admit(const string_view &origin,
                                       const string_view &content)
const
{
	if(origin == this->origin)
	{
		log::dwarning
		{
			log, "Ignoring device list update from ourselves"
		};

		return std::nullopt;
	}

	std::optional<device_list::update> edu;
	try
	{
		edu.emplace(content);
	}
	catch(const m::error &e)
	{
		log::warning
		{
			log, "Invalid device list update from %s :%s", origin, e.errstr()
		};

		return std::nullopt;
	}

	if(!id::valid_user(edu->user_id) || !my(id::user{edu->user_id}, origin))
	{
		log::warning
		{
			log, "Got device list update edu for %s from %s",
			edu->user_id,
			origin,
		};

		return std::nullopt;
	}

	log::info
	{
		log, "Got device list update from %s for %s device:%s sid:%s prev:[%s]%s",
		origin,
		edu->user_id,
		edu->device_id,
		edu->stream_id,
		string_join(edu->prev_id, ", "),
		edu->deleted? " [deleted]" : "",
	};

	return edu;
}

devsync::m::device_list::engine::result
devsync::m::device_list::engine::process(const string_view &origin,
                                         const update &update,
                                         const device_list::cache::lock &lock)
{
	assert(bool(lock));
	assert(lock.id() == update.user_id);
	const auto ret
	{
		incremental(update, lock)?
			apply(update, lock):
			resync(origin, lock)
	};

	log::debug
	{
		log, "%s sid:%s from %s %s",
		update.user_id,
		update.stream_id,
		origin,
		reflect(ret),
	};

	return ret;
}

void
devsync::m::device_list::engine::resync(const string_view &origin,
                                        const string_view &user_id)
{
	const auto lock
	{
		linearizer.acquire(std::string(user_id))
	};

	resync(origin, lock);
}

/// Whether the update follows directly on what we have. Only a single
/// prev_id naming our extremity qualifies; with several the origin merged
/// changes we may not have seen, with none it has lost track of its own
/// history.
bool
devsync::m::device_list::engine::incremental(const update &update,
                                             const device_list::cache::lock &lock)
const
{
	if(update.prev_id.size() != 1)
		return false;

	const auto extremity
	{
		cache.extremity(lock.id())
	};

	log::debug
	{
		log, "%s extremity:%s prev_id:%s",
		lock.id(),
		extremity? *extremity : std::string{"<none>"},
		update.prev_id.front(),
	};

	return extremity && *extremity == update.prev_id.front();
}

devsync::m::device_list::engine::result
devsync::m::device_list::engine::apply(const update &update,
                                       const device_list::cache::lock &lock)
{
	if(update.deleted)
		cache.del(lock, update.device_id, update.stream_id);
	else
		cache.set(lock, update.device_id, update.content, update.stream_id);

	changes.notify(update.user_id, {update.device_id});
	return INCREMENTAL;
}

devsync::m::device_list::engine::result
devsync::m::device_list::engine::resync(const string_view &origin,
                                        const device_list::cache::lock &lock)
{
	const auto &user_id
	{
		lock.id()
	};

	const std::string response
	{
		transport.query_user_devices(origin, user_id, milliseconds(resync_timeout))
	};

	// Everything is validated before the cache is touched.
	cache::devices devices;
	std::string stream_id;
	changes::device_ids device_ids;
	try
	{
		const json::object object
		{
			response
		};

		if(object.has("user_id") && json::string(object.get("user_id")) != user_id)
			throw fed::bad_response
			{
				"%s answered for %s instead of %s",
				origin,
				json::string(object.get("user_id")),
				user_id,
			};

		const auto &stream_id_
		{
			object.at("stream_id")
		};

		if(json::type(stream_id_) != json::STRING && json::type(stream_id_) != json::NUMBER)
			throw fed::bad_response
			{
				"%s sent a stream_id for %s which is not a string or number",
				origin,
				user_id,
			};

		const auto &devices_
		{
			object.at("devices")
		};

		if(json::type(devices_) != json::ARRAY)
			throw fed::bad_response
			{
				"%s sent devices for %s which are not an array",
				origin,
				user_id,
			};

		for(const auto &device : json::array{devices_})
		{
			const json::object dev
			{
				device
			};

			const auto &device_id_
			{
				dev.at("device_id")
			};

			if(json::type(device_id_) != json::STRING)
				throw fed::bad_response
				{
					"%s sent a device for %s without a device_id", origin, user_id
				};

			auto device_id
			{
				json::string(device_id_)
			};

			devices[device_id] = std::string(device);
			device_ids.emplace_back(std::move(device_id));
		}

		stream_id = json::string(stream_id_);
	}
	catch(const json::error &e)
	{
		throw fed::bad_response
		{
			"%s sent malformed devices for %s :%s", origin, user_id, e.what()
		};
	}

	cache.replace(lock, devices, stream_id);
	changes.notify(user_id, device_ids);

	log::info
	{
		log, "Resynced %s from %s; %lu devices at %s",
		user_id,
		origin,
		device_ids.size(),
		stream_id,
	};

	return RESYNC;
}

devsync::json::strung
devsync::m::device_list::engine::query(const string_view &user_id)
const
{
	if(!id::valid_user(user_id) || !my(id::user{user_id}, origin))
		throw m::BAD_REQUEST
		{
			"Can only query the devices of users on %s", origin
		};

	const auto &[stream_id, devices]
	{
		store.get_devices_with_keys_by_user(user_id)
	};

	return json::strung
	{
		{ "user_id",    user_id                   },
		{ "stream_id",  stream_id                 },
		{ "devices",    json::array{devices}      },
	};
}
