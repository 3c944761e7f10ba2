// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#pragma once
#define HAVE_DEVSYNC_HTTP_H

/// Hypertext Transfer Protocol; only the status vocabulary is carried here
/// for errors which may reach a peer or a client.
namespace devsync::http
{
	enum code :ushort;
	struct error;

	string_view status(const code &) noexcept;
}

enum devsync::http::code
:ushort
{
	OK                                      = 200,
	MULTIPLE_CHOICES                        = 300,
	BAD_REQUEST                             = 400,
	UNAUTHORIZED                            = 401,
	FORBIDDEN                               = 403,
	NOT_FOUND                               = 404,
	REQUEST_TIMEOUT                         = 408,
	CONFLICT                                = 409,
	INTERNAL_SERVER_ERROR                   = 500,
	NOT_IMPLEMENTED                         = 501,
	BAD_GATEWAY                             = 502,
	SERVICE_UNAVAILABLE                     = 503,
	GATEWAY_TIMEOUT                         = 504,
};

/// Root exception for HTTP; carries the status code and the content body
/// which would be sent with it.
struct devsync::http::error
:devsync::error
{
	http::code code {http::INTERNAL_SERVER_ERROR};
	std::string content;

	error(const http::code &, std::string content = {});
	error(generate_skip_t)
	:devsync::error{generate_skip}
	{}
};
