// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

decltype(devsync::rand::dict::upper)
devsync::rand::dict::upper
{
	"ABCDEFGHIJKLMNOPQRSTUVWXYZ"
};

namespace devsync::rand
{
	static std::mutex mutex;
	static std::random_device device;
	static std::mt19937_64 mt{device()};
}

std::string
devsync::rand::string(const size_t &len,
                      const std::string &dict)
{
	std::string ret(len, '\0');
	std::generate(begin(ret), end(ret), [&dict]
	{
		return character(dict);
	});

	return ret;
}

uint64_t
devsync::rand::integer(const uint64_t &min,
                       const uint64_t &max)
noexcept
{
	std::uniform_int_distribution<uint64_t> dist
	{
		min, max
	};

	const std::lock_guard<std::mutex> lock
	{
		mutex
	};

	return dist(mt);
}
