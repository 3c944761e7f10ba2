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
#define HAVE_DEVSYNC_LEX_CAST_H

//
// Lexical conversions
//
namespace devsync
{
	DEVSYNC_EXCEPTION(devsync::error, bad_lex_cast)

	template<class T> bool try_lex_cast(const string_view &) noexcept;
	template<class T> T lex_cast(const string_view &);
	template<class T> std::string lex_cast(const T &);

	template<> bool lex_cast(const string_view &);
	template<> std::string lex_cast(const bool &);
	template<> seconds lex_cast(const string_view &);
	template<> milliseconds lex_cast(const string_view &);
	template<> std::string lex_cast(const seconds &);
	template<> std::string lex_cast(const milliseconds &);
}

template<class T>
bool
devsync::try_lex_cast(const string_view &s)
noexcept try
{
	lex_cast<T>(s);
	return true;
}
catch(const bad_lex_cast &)
{
	return false;
}

template<class T>
T
devsync::lex_cast(const string_view &s)
try
{
	return boost::lexical_cast<T>(s.data(), s.size());
}
catch(const boost::bad_lexical_cast &e)
{
	throw bad_lex_cast
	{
		"Invalid lexical conversion of '%s' (%s)", s, e.what()
	};
}

template<class T>
std::string
devsync::lex_cast(const T &t)
try
{
	return boost::lexical_cast<std::string>(t);
}
catch(const boost::bad_lexical_cast &e)
{
	throw bad_lex_cast
	{
		"Invalid lexical conversion (%s)", e.what()
	};
}
