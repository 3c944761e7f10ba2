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
#define HAVE_DEVSYNC_M_ERROR_H

namespace devsync::m
{
	class error;
}

/// This hierarchy is designed to allow developers to throw an exception with
/// matrix protocol specific information which has the potential to become a
/// proper matrix JSON error object sent to a peer or a client. A regular
/// DEVSYNC_EXCEPTION won't be rooted in m::error; if it reaches the edge of
/// the library it is an internal server error.
///
/// The DEVSYNC_M_EXCEPTION macro is provided and should be used to declare the
/// error type first rather than throwing an m::error directly if possible.
///
class devsync::m::error
:public http::error
{
	DEVSYNC_OVERLOAD(internal)
	error(internal_t, const http::code &, std::string object);

  protected:
	DEVSYNC_OVERLOAD(child)
	template<class... args> error(child_t, args&&... a)
	:error{std::forward<args>(a)...}
	{}

  public:
	std::string errcode() const;
	std::string errstr() const;

	template<class... args> error(const http::code &, const string_view &errcode, const string_view &fmt, args&&...);
	error(const http::code &, const json::members &);
	error(const http::code &);
	error();
};

/// Macro for all matrix exceptions; all errors rooted from m::error
///
/// - parent: A parent exception class type. For this macro, the parent can
/// never be above m::error.
///
/// - name: The name of the exception is also what will be seen in the matrix
/// protocol JSON's errcode. The matrix protocol error codes are UPPER_CASE and
/// will appear as defined. This is also the name of this class itself too.
///
/// - httpcode: An HTTP code which will be used if this exception ever makes
/// it out to a client or a peer.
///
#define DEVSYNC_M_EXCEPTION(_parent_, _name_, _httpcode_)               \
struct _name_                                                           \
: _parent_                                                              \
{                                                                       \
    _name_()                                                            \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, "%s", http::status(_httpcode_)  \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(const string_view &fmt, args&&... a) \
    : _parent_                                                          \
    {                                                                   \
        child, _httpcode_, "M_"#_name_, fmt, std::forward<args>(a)...   \
    }{}                                                                 \
                                                                        \
    template<class... args> _name_(child_t, args&&... a)                \
    : _parent_                                                          \
    {                                                                   \
        child, std::forward<args>(a)...                                 \
    }{}                                                                 \
};

// These are some common m::error, but not all of them; other declarations
// may be dispersed throughout devsync::m.
namespace devsync::m
{
	DEVSYNC_M_EXCEPTION(error, UNKNOWN, http::INTERNAL_SERVER_ERROR);
	DEVSYNC_M_EXCEPTION(error, BAD_REQUEST, http::BAD_REQUEST);
	DEVSYNC_M_EXCEPTION(error, BAD_JSON, http::BAD_REQUEST);
	DEVSYNC_M_EXCEPTION(error, FORBIDDEN, http::FORBIDDEN);
	DEVSYNC_M_EXCEPTION(error, NOT_FOUND, http::NOT_FOUND);
	DEVSYNC_M_EXCEPTION(error, UNAVAILABLE, http::SERVICE_UNAVAILABLE);
}

template<class... args>
devsync::m::error::error(const http::code &status,
                         const string_view &errcode,
                         const string_view &fmt,
                         args&&... a)
:error
{
	internal, status, json::strung
	{
		{ "errcode",  errcode                                       },
		{ "error",    fmt::format(fmt, std::forward<args>(a)...)    },
	}
}
{}
