// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

devsync::m::device_list::cache::cache(m::store &store)
:store{store}
{
}

std::optional<std::string>
devsync::m::device_list::cache::extremity(const string_view &user_id)
const
{
	return store.get_device_list_remote_extremity(user_id);
}

devsync::m::device_list::cache::devices
devsync::m::device_list::cache::get(const string_view &user_id)
const
{
	return store.get_cached_devices_for_user(user_id);
}

void
devsync::m::device_list::cache::replace(const lock &lock,
                                        const devices &devices,
                                        const string_view &stream_id)
{
	assert(bool(lock));
	store.update_remote_device_list_cache(lock.id(), devices, stream_id);
	log::debug
	{
		log, "%s replaced with %lu devices at %s",
		lock.id(),
		devices.size(),
		stream_id,
	};
}

void
devsync::m::device_list::cache::set(const lock &lock,
                                    const string_view &device_id,
                                    const string_view &content,
                                    const string_view &stream_id)
{
	assert(bool(lock));
	store.update_remote_device_list_cache_entry(lock.id(), device_id, content, stream_id);
}

void
devsync::m::device_list::cache::del(const lock &lock,
                                    const string_view &device_id,
                                    const string_view &stream_id)
{
	assert(bool(lock));
	store.delete_remote_device_list_cache_entry(lock.id(), device_id, stream_id);
}
