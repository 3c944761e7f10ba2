// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace devsync::m
{
	static std::optional<std::string> make_opt(const std::optional<string_view> &);

	extern log::log device_log;
}

decltype(devsync::m::device_log)
devsync::m::device_log
{
	"m.device", 'd'
};

decltype(devsync::m::devices::id_attempts)
devsync::m::devices::id_attempts
{
	{ "name",     "devsync.m.device.id.attempts" },
	{ "default",  5L                             },
};

decltype(devsync::m::devices::id_length)
devsync::m::devices::id_length
{
	{ "name",     "devsync.m.device.id.length"   },
	{ "default",  10L                            },
};

devsync::m::devices::devices(m::store &store,
                             device_list::changes &changes)
:store{store}
,changes{changes}
{
}

std::string
devsync::m::devices::add(const string_view &user_id,
                         const std::optional<string_view> &device_id,
                         const std::optional<string_view> &display_name)
{
	const auto name
	{
		make_opt(display_name)
	};

	if(device_id)
	{
		const bool created
		{
			store.store_device(user_id, *device_id, name)
		};

		if(created)
		{
			log::info
			{
				device_log, "%s registered device %s", user_id, *device_id
			};

			changes.notify(user_id, {std::string(*device_id)});
		}

		return std::string(*device_id);
	}

	// If the device id is not specified, we'll autogen one, but loop a few
	// times in case of a clash.
	const size_t attempts(id_attempts);
	for(size_t i(0); i < attempts; ++i)
	{
		auto id
		{
			generate()
		};

		if(!store.store_device(user_id, id, name))
		{
			log::dwarning
			{
				device_log, "Generated device ID %s for %s already exists (attempt %lu of %lu)",
				id,
				user_id,
				i + 1,
				attempts,
			};

			continue;
		}

		log::info
		{
			device_log, "%s registered new device %s", user_id, id
		};

		changes.notify(user_id, {id});
		return id;
	}

	throw m::ALLOCATION_EXHAUSTED
	{
		"Couldn't generate a device ID for %s after %lu attempts", user_id, attempts
	};
}

devsync::m::device
devsync::m::devices::get(const string_view &user_id,
                         const string_view &device_id)
const try
{
	std::vector<device> ret
	{
		store.get_device(user_id, device_id)
	};

	last_seen(user_id, ret);
	return std::move(ret.front());
}
catch(const store::not_found &e)
{
	throw m::NOT_FOUND
	{
		"Device %s of %s not found", device_id, user_id
	};
}

std::vector<devsync::m::device>
devsync::m::devices::list(const string_view &user_id)
const
{
	auto ret
	{
		store.get_devices_by_user(user_id)
	};

	last_seen(user_id, ret);
	return ret;
}

void
devsync::m::devices::update(const string_view &user_id,
                            const string_view &device_id,
                            const std::optional<string_view> &display_name)
{
	try
	{
		store.update_device(user_id, device_id, make_opt(display_name));
	}
	catch(const store::not_found &e)
	{
		throw m::NOT_FOUND
		{
			"Device %s of %s not found", device_id, user_id
		};
	}

	changes.notify(user_id, {std::string(device_id)});
}

void
devsync::m::devices::del(const string_view &user_id,
                         const string_view &device_id)
{
	try
	{
		store.delete_device(user_id, device_id);
	}
	catch(const store::not_found &e)
	{
		log::dwarning
		{
			device_log, "Delete of absent device %s of %s", device_id, user_id
		};

		return;
	}

	store.user_delete_access_tokens(user_id, device_id);
	store.delete_keys_by_device(user_id, device_id);
	log::info
	{
		device_log, "%s deleted device %s", user_id, device_id
	};

	changes.notify(user_id, {std::string(device_id)});
}

std::string
devsync::m::devices::generate()
const
{
	return rand::string(size_t(id_length), rand::dict::upper);
}

void
devsync::m::devices::last_seen(const string_view &user_id,
                               std::vector<device> &out)
const
{
	store::device_ids device_ids;
	device_ids.reserve(out.size());
	for(const auto &device : out)
		device_ids.emplace_back(device.device_id);

	const auto ips
	{
		store.get_last_client_ip_by_device(user_id, device_ids)
	};

	for(auto &device : out)
	{
		const auto it
		{
			ips.find(device.device_id)
		};

		if(it == end(ips))
			continue;

		device.last_seen_ip = it->second.ip;
		device.last_seen_ts = it->second.last_seen;
	}
}

std::optional<std::string>
devsync::m::make_opt(const std::optional<string_view> &s)
{
	if(!s)
		return std::nullopt;

	return std::string(*s);
}
