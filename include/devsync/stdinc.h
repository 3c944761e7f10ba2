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
#define HAVE_DEVSYNC_STDINC_H

//
// Standard includes
//
// This header includes almost everything we use out of the standard library.
// It is the pre-compiled header of both libraries; C++ std headers have very
// little namespace pollution and risk of conflicts.
//

extern "C"
{
	#include <assert.h>
	#include <unistd.h>
	#include <sys/types.h>
}

// Typography
#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <typeindex>
#include <type_traits>

// Errors
#include <cerrno>
#include <exception>
#include <system_error>

// Dynamic memory
#include <new>
#include <memory>

// Containers
#include <optional>
#include <tuple>
#include <array>
#include <vector>
#include <list>
#include <deque>
#include <set>
#include <map>
#include <unordered_map>

// Strings
#include <cstring>
#include <cctype>
#include <string>
#include <string_view>

// Numerics
#include <random>

// Chronography
#include <ctime>
#include <chrono>

// Concurrency
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>

// Input/Output
#include <cstdio>
#include <iosfwd>
#include <sstream>
#include <iomanip>

// Other standard suites
#include <utility>
#include <functional>
#include <algorithm>

namespace devsync
{
	using std::string_view;
	using std::nothrow_t;
	using std::nothrow;
	using std::chrono::hours;
	using std::chrono::seconds;
	using std::chrono::milliseconds;
	using std::chrono::microseconds;
	using std::chrono::duration_cast;
	using std::chrono::system_clock;
	using std::chrono::steady_clock;
	using std::begin;
	using std::end;
}
