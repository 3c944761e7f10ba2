// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

template<>
bool
devsync::lex_cast(const string_view &s)
{
	if(s == "true" || s == "1")
		return true;

	if(s == "false" || s == "0")
		return false;

	throw bad_lex_cast
	{
		"Invalid lexical conversion of '%s' to boolean", s
	};
}

template<>
std::string
devsync::lex_cast(const bool &b)
{
	return b? "true" : "false";
}

template<>
devsync::seconds
devsync::lex_cast(const string_view &s)
{
	return seconds
	{
		lex_cast<seconds::rep>(s)
	};
}

template<>
devsync::milliseconds
devsync::lex_cast(const string_view &s)
{
	return milliseconds
	{
		lex_cast<milliseconds::rep>(s)
	};
}

template<>
std::string
devsync::lex_cast(const seconds &s)
{
	return lex_cast(s.count());
}

template<>
std::string
devsync::lex_cast(const milliseconds &ms)
{
	return lex_cast(ms.count());
}
