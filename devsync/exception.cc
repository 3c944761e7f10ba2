// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(devsync::version)
devsync::version
{
	"devsync 1.0"
};

//
// exception
//

ssize_t
devsync::exception::generate(const char *const &name,
                             const string_view &msg)
noexcept
{
	const bool empty(msg.empty() || msg.front() == ' ');
	const int ret
	{
		::snprintf(buf, sizeof(buf), "%s%s%.*s",
		           name,
		           empty? "." : " :",
		           int(msg.size()),
		           msg.data())
	};

	return std::min(ssize_t(ret), ssize_t(sizeof(buf) - 1));
}

const char *
devsync::exception::what()
const noexcept
{
	return buf;
}
