// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(devsync::m::log)
devsync::m::log
{
	"m", 'm'
};

decltype(devsync::m::fed::log)
devsync::m::fed::log
{
	"fed", 'F'
};

decltype(devsync::m::device_list::log)
devsync::m::device_list::log
{
	"m.device_list", 'D'
};
