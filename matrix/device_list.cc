// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

namespace devsync::m::device_list
{
	static string_view required(const json::object &, const string_view &key, const enum json::type &);
}

devsync::string_view
devsync::m::device_list::reflect(const engine::result &result)
noexcept
{
	switch(result)
	{
		case engine::IGNORED:      return "IGNORED";
		case engine::INCREMENTAL:  return "INCREMENTAL";
		case engine::RESYNC:       return "RESYNC";
	}

	return "??????";
}

//
// update::update
//

devsync::m::device_list::update::update(const string_view &text)
try
{
	const json::object object
	{
		text
	};

	user_id = json::string(required(object, "user_id", json::STRING));
	device_id = json::string(required(object, "device_id", json::STRING));

	// The stream_id is opaque to us; servers send either a string or a
	// number and it is only ever compared for equality with a prev_id.
	const auto &stream_id_
	{
		object.at("stream_id")
	};

	if(json::type(stream_id_) != json::STRING && json::type(stream_id_) != json::NUMBER)
		throw m::BAD_JSON
		{
			"stream_id must be a string or a number"
		};

	stream_id = json::string(stream_id_);
	if(object.has("prev_id"))
	{
		const json::array prev_ids
		{
			required(object, "prev_id", json::ARRAY)
		};

		prev_id.reserve(prev_ids.size());
		for(const auto &prev : prev_ids)
			prev_id.emplace_back(json::string(prev));
	}

	const auto &deleted_
	{
		object.get("deleted", "false")
	};

	deleted = json::type(deleted_) == json::LITERAL && json::string(deleted_) == "true";

	static const string_view envelope[]
	{
		"user_id", "device_id", "stream_id", "prev_id"
	};

	std::vector<json::member> members;
	members.reserve(object.size());
	for(const auto &[key, val] : object)
		if(std::find(std::begin(envelope), std::end(envelope), key) == std::end(envelope))
			members.emplace_back(key, json::strung{std::string(val)});

	content = json::strung
	{
		members
	};
}
catch(const json::error &e)
{
	throw m::BAD_JSON
	{
		"m.device_list_update :%s", e.what()
	};
}

devsync::string_view
devsync::m::device_list::required(const json::object &object,
                                  const string_view &key,
                                  const enum json::type &type)
{
	const auto &val
	{
		object.at(key)
	};

	if(json::type(val) != type)
		throw m::BAD_JSON
		{
			"'%s' must be a json %s", key, json::reflect(type)
		};

	return val;
}
