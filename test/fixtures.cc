// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include "fixtures.h"

const std::string
devsync::test::origin
{
	"local.test"
};

//
// store
//

void
devsync::test::store::call(const string_view &name)
{
	calls.emplace_back(name);
}

bool
devsync::test::store::store_device(const string_view &user_id,
                                   const string_view &device_id,
                                   const std::optional<std::string> &display_name)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("store_device");
	if(collisions)
	{
		--collisions;
		return false;
	}

	const key k{user_id, device_id};
	if(devices.count(k))
		return false;

	m::device device;
	device.user_id = std::string(user_id);
	device.device_id = std::string(device_id);
	device.display_name = display_name;
	device.created_at = time_ms();
	devices.emplace(k, std::move(device));
	keys.emplace(k);
	tokens[k] = 1;
	return true;
}

devsync::m::device
devsync::test::store::get_device(const string_view &user_id,
                                 const string_view &device_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_device");
	const auto it(devices.find(key{user_id, device_id}));
	if(it == end(devices))
		throw not_found
		{
			"device %s of %s", device_id, user_id
		};

	return it->second;
}

std::vector<devsync::m::device>
devsync::test::store::get_devices_by_user(const string_view &user_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_devices_by_user");
	std::vector<m::device> ret;
	for(const auto &[k, device] : devices)
		if(k.first == user_id)
			ret.emplace_back(device);

	return ret;
}

void
devsync::test::store::update_device(const string_view &user_id,
                                    const string_view &device_id,
                                    const std::optional<std::string> &display_name)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("update_device");
	const auto it(devices.find(key{user_id, device_id}));
	if(it == end(devices))
		throw not_found
		{
			"device %s of %s", device_id, user_id
		};

	if(display_name)
		it->second.display_name = display_name;
}

void
devsync::test::store::delete_device(const string_view &user_id,
                                    const string_view &device_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("delete_device");
	if(!devices.erase(key{user_id, device_id}))
		throw not_found
		{
			"device %s of %s", device_id, user_id
		};
}

void
devsync::test::store::delete_keys_by_device(const string_view &user_id,
                                            const string_view &device_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("delete_keys_by_device");
	keys.erase(key{user_id, device_id});
}

void
devsync::test::store::user_delete_access_tokens(const string_view &user_id,
                                                const string_view &device_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("user_delete_access_tokens");
	if(fail_tokens)
		throw error
		{
			"token revocation for %s unavailable", user_id
		};

	tokens.erase(key{user_id, device_id});
}

devsync::m::store::client_ips
devsync::test::store::get_last_client_ip_by_device(const string_view &user_id,
                                                   const device_ids &device_ids)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_last_client_ip_by_device");
	client_ips ret;
	for(const auto &device_id : device_ids)
	{
		const auto it(ips.find(key{user_id, device_id}));
		if(it != end(ips))
			ret.emplace(device_id, it->second);
	}

	return ret;
}

devsync::m::store::devices_with_keys
devsync::test::store::get_devices_with_keys_by_user(const string_view &user_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_devices_with_keys_by_user");
	const auto it(with_keys.find(std::string(user_id)));
	if(it == end(with_keys))
		return { stream_token, "[]" };

	return it->second;
}

uint64_t
devsync::test::store::get_device_stream_token()
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_device_stream_token");
	return stream_token;
}

void
devsync::test::store::add_device_change_to_streams(const uint64_t &position,
                                                   const string_view &user_id,
                                                   const device_ids &device_ids,
                                                   const hosts &hosts)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("add_device_change_to_streams");
	if(fail_changes)
		throw error
		{
			"device_lists_stream unavailable"
		};

	changes.emplace_back(change{position, std::string(user_id), device_ids, hosts});
	stream_token = std::max(stream_token, position);
}

devsync::m::store::user_ids
devsync::test::store::get_user_whose_devices_changed(const uint64_t &from,
                                                     const uint64_t &to)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_user_whose_devices_changed");
	user_ids ret;
	for(const auto &change : changes)
		if(change.position > from && change.position <= to)
			ret.emplace(change.user_id);

	return ret;
}

devsync::m::store::room_ids
devsync::test::store::get_rooms_for_user(const string_view &user_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_rooms_for_user");
	const auto it(rooms.find(std::string(user_id)));
	return it != end(rooms)? it->second : room_ids{};
}

std::optional<std::string>
devsync::test::store::get_device_list_remote_extremity(const string_view &user_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_device_list_remote_extremity");
	const auto it(remotes.find(std::string(user_id)));
	if(it == end(remotes))
		return std::nullopt;

	return it->second.extremity;
}

devsync::m::store::cached_devices
devsync::test::store::get_cached_devices_for_user(const string_view &user_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("get_cached_devices_for_user");
	const auto it(remotes.find(std::string(user_id)));
	return it != end(remotes)? it->second.devices : cached_devices{};
}

void
devsync::test::store::update_remote_device_list_cache(const string_view &user_id,
                                                      const cached_devices &devices,
                                                      const string_view &stream_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("update_remote_device_list_cache");
	auto &remote(remotes[std::string(user_id)]);
	remote.devices = devices;
	remote.extremity = std::string(stream_id);
}

void
devsync::test::store::update_remote_device_list_cache_entry(const string_view &user_id,
                                                            const string_view &device_id,
                                                            const string_view &content,
                                                            const string_view &stream_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("update_remote_device_list_cache_entry");
	auto &remote(remotes[std::string(user_id)]);
	remote.devices[std::string(device_id)] = std::string(content);
	remote.extremity = std::string(stream_id);
}

void
devsync::test::store::delete_remote_device_list_cache_entry(const string_view &user_id,
                                                            const string_view &device_id,
                                                            const string_view &stream_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	call("delete_remote_device_list_cache_entry");
	auto &remote(remotes[std::string(user_id)]);
	remote.devices.erase(std::string(device_id));
	remote.extremity = std::string(stream_id);
}

void
devsync::test::store::join(const string_view &user_id,
                           const string_view &room_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	rooms[std::string(user_id)].emplace(room_id);
}

std::vector<std::string>
devsync::test::store::calls_since(const size_t &pos)
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	return { std::next(begin(calls), std::min(pos, calls.size())), end(calls) };
}

std::vector<devsync::test::store::change>
devsync::test::store::changes_copy()
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	return changes;
}

size_t
devsync::test::store::count_changes()
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	return changes.size();
}

//
// state
//

std::set<std::string>
devsync::test::state::get_current_users_in_room(const string_view &room_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	const auto it(members.find(std::string(room_id)));
	return it != end(members)? it->second : std::set<std::string>{};
}

void
devsync::test::state::join(const string_view &user_id,
                           const string_view &room_id)
{
	const std::lock_guard<std::mutex> lock{mutex};
	members[std::string(room_id)].emplace(user_id);
}

//
// notifier
//

void
devsync::test::notifier::on_new_event(const string_view &kind,
                                      const uint64_t &position,
                                      const std::set<std::string> &room_ids)
{
	const std::lock_guard<std::mutex> lock{mutex};
	events.emplace_back(event{std::string(kind), position, room_ids});
}

std::vector<devsync::test::notifier::event>
devsync::test::notifier::events_copy()
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	return events;
}

//
// transport
//

void
devsync::test::transport::send_device_messages(const string_view &host)
{
	const std::lock_guard<std::mutex> lock{mutex};
	pokes.emplace_back(host);
	if(unreachable.count(std::string(host)))
		throw m::fed::error
		{
			"%s unreachable", host
		};
}

std::string
devsync::test::transport::query_user_devices(const string_view &origin,
                                             const string_view &user_id,
                                             const milliseconds &timeout)
{
	std::unique_lock<std::mutex> lock{mutex};
	const std::string user(user_id);
	++queries[user];
	order.emplace_back(user);
	last_timeout = timeout;
	++entered;
	cond.notify_all();
	cond.wait(lock, [this]
	{
		return open;
	});

	if(timeouts.count(user))
		throw m::fed::timeout
		{
			"%s did not answer for %s within %ld ms", origin, user_id, timeout.count()
		};

	const auto it(responses.find(user));
	if(it == end(responses))
		throw m::fed::error
		{
			"%s has no devices for %s", origin, user_id
		};

	return it->second;
}

void
devsync::test::transport::respond(const string_view &user_id,
                                  const string_view &response)
{
	const std::lock_guard<std::mutex> lock{mutex};
	responses[std::string(user_id)] = std::string(response);
}

size_t
devsync::test::transport::query_count(const string_view &user_id)
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	const auto it(queries.find(std::string(user_id)));
	return it != end(queries)? it->second : 0;
}

std::vector<std::string>
devsync::test::transport::pokes_copy()
const
{
	const std::lock_guard<std::mutex> lock{mutex};
	return pokes;
}

void
devsync::test::transport::close()
{
	const std::lock_guard<std::mutex> lock{mutex};
	open = false;
}

void
devsync::test::transport::release()
{
	const std::lock_guard<std::mutex> lock{mutex};
	open = true;
	cond.notify_all();
}

bool
devsync::test::transport::wait_entered(const size_t &n,
                                       const milliseconds &timeout)
{
	std::unique_lock<std::mutex> lock{mutex};
	return cond.wait_for(lock, timeout, [this, &n]
	{
		return entered >= n;
	});
}

//
// env
//

devsync::test::env::env(m::fed::dispatcher::async_t)
:transport{m::fed::dispatcher::async}
{
}

void
devsync::test::env::join(const string_view &user_id,
                         const string_view &room_id)
{
	store.join(user_id, room_id);
	state.join(user_id, room_id);
}
