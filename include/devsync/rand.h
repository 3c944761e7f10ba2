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
#define HAVE_DEVSYNC_RAND_H

/// Some character set dictionaries
namespace devsync::rand::dict
{
	extern const std::string upper;
}

/// Tools for randomization. The engine is shared by all threads and guarded
/// internally.
namespace devsync::rand
{
	// Random integer
	uint64_t integer(const uint64_t &min, const uint64_t &max) noexcept; // inclusive

	// Random character from dictionary
	char character(const std::string &dict) noexcept;

	// Random string from dictionary
	std::string string(const size_t &len, const std::string &dict);
}

/// Random character from dictionary
inline char
devsync::rand::character(const std::string &dict)
noexcept
{
	assert(!dict.empty());
	const auto pos
	{
		integer(0, dict.size() - 1)
	};

	assert(pos < dict.size());
	return dict[pos];
}
