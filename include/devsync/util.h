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
#define HAVE_DEVSYNC_UTIL_H

namespace devsync
{
	/// Declare a tag type and a constant for overloading functions which
	/// would otherwise be ambiguous.
	#define DEVSYNC_OVERLOAD(NAME)                 \
	    static constexpr struct NAME##_t {} NAME {};

	std::pair<string_view, string_view> split(const string_view &, const char &) noexcept;

	/// Milliseconds since the epoch; the matrix protocol's notion of time.
	time_t time_ms() noexcept;

	template<class T> std::string string_join(const T &, const string_view &sep);
}

/// Split at the first occurrence of the character. The character itself is
/// not in either half; if it is absent the second half is empty.
inline std::pair<devsync::string_view, devsync::string_view>
devsync::split(const string_view &s,
               const char &c)
noexcept
{
	const auto pos(s.find(c));
	if(pos == s.npos)
		return { s, string_view{} };

	return { s.substr(0, pos), s.substr(pos + 1) };
}

inline time_t
devsync::time_ms()
noexcept
{
	const auto now
	{
		duration_cast<milliseconds>(system_clock::now().time_since_epoch())
	};

	return now.count();
}

template<class T>
std::string
devsync::string_join(const T &items,
                     const string_view &sep)
{
	std::string ret;
	bool first {true};
	for(const auto &item : items)
	{
		if(!first)
			ret.append(sep);

		ret.append(string_view{item});
		first = false;
	}

	return ret;
}
