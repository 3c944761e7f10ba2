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
// error::error
//

devsync::m::error::error()
:error
{
	internal, http::INTERNAL_SERVER_ERROR, std::string{},
}
{}

devsync::m::error::error(const http::code &c)
:error
{
	internal, c, std::string{},
}
{}

devsync::m::error::error(const http::code &c,
                         const json::members &members)
:error
{
	internal, c, json::strung{members},
}
{}

devsync::m::error::error(internal_t,
                         const http::code &c,
                         std::string object)
:http::error
{
	c, std::move(object)
}
{
	if(content.empty())
		return;

	const auto len
	{
		strnlen(buf, sizeof(buf))
	};

	::snprintf(buf + len, sizeof(buf) - len, " %s :%s",
	           errcode().c_str(),
	           errstr().c_str());
}

std::string
devsync::m::error::errstr()
const try
{
	const json::object content
	{
		this->http::error::content
	};

	return json::string(content.get("error"));
}
catch(const json::error &e)
{
	return "(There was an error with the error object)";
}

std::string
devsync::m::error::errcode()
const try
{
	const json::object content
	{
		this->http::error::content
	};

	return json::string(content.get("errcode", "\"M_UNKNOWN\""));
}
catch(const json::error &e)
{
	return "M_BAD_ERROR";
}
