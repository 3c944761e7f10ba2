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
#define HAVE_DEVSYNC_FMT_H

/// Typesafe format strings.
///
/// The format string follows printf(3) and the arguments are passed by
/// reference to boost::format; length modifiers are accepted and ignored so
/// an std::string or a string_view can be given to %s directly, and integers
/// of any width to %d/%u/%lu.
namespace devsync::fmt
{
	DEVSYNC_EXCEPTION(devsync::error, error);
	DEVSYNC_EXCEPTION(error, invalid_format);

	struct snstringf;

	template<class... args> std::string format(const string_view &fmt, args&&...);
}

/// Formatted std::string of no more than max characters.
struct devsync::fmt::snstringf
:std::string
{
	template<class... args>
	snstringf(const size_t &max,
	          const string_view &fmt,
	          args&&... a)
	:std::string
	{
		format(fmt, std::forward<args>(a)...)
	}
	{
		if(size() > max)
			resize(max);
	}
};

template<class... args>
std::string
devsync::fmt::format(const string_view &fmt,
                     args&&... a)
try
{
	boost::format f
	{
		std::string{fmt}
	};

	// Surplus or missing arguments are tolerated; the log is a bad place to
	// discover that a format string is wrong.
	f.exceptions(boost::io::all_error_bits ^ (boost::io::too_many_args_bit | boost::io::too_few_args_bit));
	static_cast<void>((f % ... % a));
	return f.str();
}
catch(const boost::io::format_error &e)
{
	throw invalid_format
	{
		"'%s' :%s", fmt, e.what()
	};
}

template<class... args>
ssize_t
devsync::exception::generate(const char *const &name,
                             const string_view &fmt,
                             args&&... a)
noexcept try
{
	const std::string msg
	{
		fmt::format(fmt, std::forward<args>(a)...)
	};

	return generate(name, msg);
}
catch(const std::exception &e)
{
	return generate(name, fmt);
}
