// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

devsync::http::error::error(const http::code &code,
                            std::string content)
:devsync::error
{
	generate_skip
}
,code{code}
,content{std::move(content)}
{
	generate("http::error", status(code));
}

devsync::string_view
devsync::http::status(const code &code)
noexcept
{
	switch(code)
	{
		case OK:                         return "OK";
		case MULTIPLE_CHOICES:           return "Multiple Choices";
		case BAD_REQUEST:                return "Bad Request";
		case UNAUTHORIZED:               return "Unauthorized";
		case FORBIDDEN:                  return "Forbidden";
		case NOT_FOUND:                  return "Not Found";
		case REQUEST_TIMEOUT:            return "Request Timeout";
		case CONFLICT:                   return "Conflict";
		case INTERNAL_SERVER_ERROR:      return "Internal Server Error";
		case NOT_IMPLEMENTED:            return "Not Implemented";
		case BAD_GATEWAY:                return "Bad Gateway";
		case SERVICE_UNAVAILABLE:        return "Service Unavailable";
		case GATEWAY_TIMEOUT:            return "Gateway Timeout";
	}

	return "Unknown";
}
