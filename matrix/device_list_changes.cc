// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

devsync::m::device_list::changes::changes(const string_view &origin,
                                          m::store &store,
                                          m::state &state,
                                          m::notifier &notifier,
                                          fed::transport &transport)
:origin{origin}
,store{store}
,state{state}
,notifier{notifier}
,transport{transport}
,stream
{
	store.get_device_stream_token()
}
{
	log::info
	{
		log, "Device list stream for %s resumes after %lu",
		this->origin,
		stream.current(),
	};
}

uint64_t
devsync::m::device_list::changes::notify(const string_view &user_id,
                                         const device_ids &device_ids)
{
	const auto room_ids
	{
		store.get_rooms_for_user(user_id)
	};

	const auto hosts
	{
		my(id::user{user_id}, origin)?
			interested(room_ids):
			changes::hosts{}
	};

	auto position
	{
		stream.allocate_next()
	};

	// The position is retired whether or not this throws; a reader at
	// current() will step over a change which never made it to the store.
	store.add_device_change_to_streams(position, user_id, device_ids, hosts);
	const uint64_t ret
	{
		position
	};

	position.retire();
	notifier.on_new_event("device_list_key", ret, room_ids);

	log::debug
	{
		log, "%s changed %lu devices at %lu; %lu rooms; %lu hosts",
		user_id,
		device_ids.size(),
		ret,
		room_ids.size(),
		hosts.size(),
	};

	if(!hosts.empty())
		log::info
		{
			log, "Sending device list update notif for %s to %s",
			user_id,
			string_join(hosts, ", "),
		};

	for(const auto &host : hosts) try
	{
		transport.send_device_messages(host);
	}
	catch(const std::exception &e)
	{
		log::error
		{
			log, "Failed to poke %s about %s at %lu :%s",
			host,
			user_id,
			ret,
			e.what(),
		};
	}

	return ret;
}

devsync::m::device_list::changes::hosts
devsync::m::device_list::changes::interested(const room_ids &room_ids)
const
{
	hosts ret;
	for(const auto &room_id : room_ids)
		for(const auto &member : state.get_current_users_in_room(room_id))
		{
			if(!id::valid_user(member))
			{
				log::dwarning
				{
					log, "Ignoring member '%s' of %s", member, room_id
				};

				continue;
			}

			ret.emplace(id::user{member}.host());
		}

	ret.erase(origin);
	return ret;
}

devsync::m::device_list::changes::user_ids
devsync::m::device_list::changes::since(const room_ids &room_ids,
                                        const uint64_t &from)
const
{
	const auto to
	{
		current()
	};

	user_ids ret;
	if(from >= to)
		return ret;

	for(const auto &user_id : store.get_user_whose_devices_changed(from, to))
	{
		const auto their_rooms
		{
			store.get_rooms_for_user(user_id)
		};

		const bool shared
		{
			std::any_of(begin(their_rooms), end(their_rooms), [&room_ids]
			(const auto &room_id)
			{
				return room_ids.count(room_id) > 0;
			})
		};

		if(shared)
			ret.emplace(user_id);
	}

	return ret;
}

uint64_t
devsync::m::device_list::changes::current()
const
{
	return stream.current();
}
