// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace devsync::conf
{
	static std::string env_name(const string_view &key);
	static std::mutex mutex;
}

decltype(devsync::conf::item<>::NAME_MAX_LEN)
devsync::conf::item<>::NAME_MAX_LEN
{
	127
};

/// Items register during static initialization of several units, so the
/// map is constructed on first use.
std::map<devsync::string_view, devsync::conf::item<> *> &
devsync::conf::items()
{
	static std::map<string_view, item<> *> items;
	return items;
}

size_t
devsync::conf::reset()
{
	size_t ret(0);
	for(const auto &[key, item] : items())
		ret += item->reset();

	return ret;
}

bool
devsync::conf::reset(const string_view &key)
{
	const auto it
	{
		items().find(key)
	};

	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	return it->second->reset();
}

bool
devsync::conf::reset(std::nothrow_t,
                     const string_view &key)
try
{
	return reset(key);
}
catch(const not_found &e)
{
	return false;
}

bool
devsync::conf::set(std::nothrow_t,
                   const string_view &key,
                   const string_view &value)
try
{
	return set(key, value);
}
catch(const error &e)
{
	log::error
	{
		"%s", e.what()
	};

	return false;
}

bool
devsync::conf::set(const string_view &key,
                   const string_view &value)
{
	const auto it
	{
		items().find(key)
	};

	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	auto &item(*it->second);
	return item.set(value);
}

std::string
devsync::conf::get(const string_view &key)
{
	const auto it
	{
		items().find(key)
	};

	if(it == end(items()))
		throw not_found
		{
			"Conf item '%s' is not available", key
		};

	const auto &item(*it->second);
	return item.get();
}

bool
devsync::conf::exists(const string_view &key)
{
	return items().count(key) > 0;
}

std::string
devsync::conf::env_name(const string_view &key)
{
	std::string ret(key);
	std::replace(begin(ret), end(ret), '.', '_');
	return ret;
}

//
// item
//

devsync::conf::item<>::item(const json::members &members,
                            conf::set_cb set_cb)
:set_cb{std::move(set_cb)}
{
	const json::strung feature
	{
		members
	};

	const json::object object
	{
		feature
	};

	name = json::string(object.at("name"));
	default_ = json::string(object.get("default", "null"));

	if(name.empty() || name.size() > NAME_MAX_LEN)
		throw bad_value
		{
			"Conf item name '%s' is not valid", name
		};

	const std::lock_guard<std::mutex> lock
	{
		conf::mutex
	};

	const auto iit
	{
		items().emplace(name, this)
	};

	if(!iit.second)
		throw error
		{
			"Conf item named '%s' already exists", name
		};
}

devsync::conf::item<>::~item()
noexcept
{
	if(name.empty())
		return;

	const std::lock_guard<std::mutex> lock
	{
		conf::mutex
	};

	const auto it
	{
		items().find(name)
	};

	if(it != end(items()) && it->second == this)
		items().erase(it);
}

/// Called by the derived constructor once its value exists; the environment
/// overrides the default.
void
devsync::conf::item<>::call_init()
{
	const auto env
	{
		env_name(name)
	};

	const char *const val
	{
		::getenv(env.c_str())
	};

	if(val)
		set(val);
}

bool
devsync::conf::item<>::reset()
{
	return set(default_);
}

bool
devsync::conf::item<>::set(const string_view &val)
try
{
	const bool ret
	{
		on_set(val)
	};

	if(set_cb)
		set_cb();

	return ret;
}
catch(const bad_lex_cast &e)
{
	throw bad_value
	{
		"%s :%s", name, e.what()
	};
}

std::string
devsync::conf::item<>::get()
const
{
	return on_get();
}

//
// item<std::string>
//

devsync::conf::item<std::string>::item(const json::members &members,
                                       conf::set_cb set_cb)
:conf::item<>
{
	members, std::move(set_cb)
}
,value
{
	default_
}
{
	call_init();
}

bool
devsync::conf::item<std::string>::on_set(const string_view &s)
{
	_value = std::string{s};
	return true;
}

std::string
devsync::conf::item<std::string>::on_get()
const
{
	return _value;
}
