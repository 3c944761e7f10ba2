// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <iostream>

namespace devsync::log
{
	static bool is_console_stderr(const level &) noexcept;
	static void slog(const log &, const level &, const string_view &) noexcept;

	extern const size_t LOG_NAME_TRUNC;
	extern const std::array<string_view, level::_NUM_> console_ansi;
	extern std::array<std::atomic<bool>, level::_NUM_> console_enable_;
	extern std::mutex mutex;
}

decltype(devsync::log::hook::list)
devsync::log::hook::list;

decltype(devsync::log::mutex)
devsync::log::mutex;

decltype(devsync::log::LOG_NAME_TRUNC)
devsync::log::LOG_NAME_TRUNC
{
	14
};

decltype(devsync::log::console_ansi)
devsync::log::console_ansi
{{
	"\033[1;5;37;45m",   // CRITICAL
	"\033[1;37;41m",     // ERROR
	"\033[0;30;43m",     // WARNING
	"\033[1;37;46m",     // NOTICE
	"\033[1;37;42m",     // INFO
	"\033[0;31;47m",     // DERROR
	"\033[0;30;47m",     // DWARNING
	"\033[1;30;47m",     // DEBUG
}};

/// DEBUG is very noisy so it always starts off.
decltype(devsync::log::console_enable_)
devsync::log::console_enable_
{{
	{true}, {true}, {true}, {true}, {true}, {true}, {true}, {false},
}};

/// The general logger is for all core and miscellaneous log messages. This
/// is the default logger target for log:: calls which do not pass a specific
/// logger.
decltype(devsync::log::general)
devsync::log::general
{
	"devsync", 'G'
};

//
// log::log
//

devsync::log::log::log(const string_view &name,
                       const char &snote)
:name{name}
,snote{snote}
{
}

//
// log::hook
//

devsync::log::hook::callback::callback(function func)
:func{std::move(func)}
{
	const std::lock_guard<std::mutex> lock
	{
		devsync::log::mutex
	};

	hook::list.emplace_back(this);
}

devsync::log::hook::callback::~callback()
noexcept
{
	const std::lock_guard<std::mutex> lock
	{
		devsync::log::mutex
	};

	hook::list.remove(this);
}

//
// vlog
//

devsync::log::vlog::vlog(const log &log,
                         const level &lev,
                         const string_view &msg)
noexcept
{
	slog(log, lev, msg);
}

void
devsync::log::slog(const log &log,
                   const level &lev,
                   const string_view &msg)
noexcept try
{
	char date[64];
	const auto now(system_clock::to_time_t(system_clock::now()));
	struct tm tm;
	::gmtime_r(&now, &tm);
	const size_t date_len
	{
		::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm)
	};

	const auto &ansi
	{
		console_ansi.at(lev)
	};

	const string_view trunc_name
	{
		log.name.substr(0, LOG_NAME_TRUNC)
	};

	std::stringstream s;
	s
	<< string_view{date, date_len}
	<< ' '
	<< ansi
	<< std::setw(8)
	<< std::right
	<< reflect(lev)
	<< "\033[0m "
	<< std::setw(LOG_NAME_TRUNC)
	<< std::left
	<< trunc_name
	<< " :"
	<< msg;

	const std::string line
	{
		s.str()
	};

	// One line at a time regardless of thread; listeners see each line under
	// the same lock, in the same order as the console.
	const std::lock_guard<std::mutex> lock
	{
		devsync::log::mutex
	};

	for(const auto *const cb : hook::list)
		cb->func(log, lev, line);

	if(!console_enabled(lev))
		return;

	auto &out
	{
		is_console_stderr(lev)? std::cerr : std::cout
	};

	out << line << '\n';
}
catch(const std::exception &e)
{
	// Nowhere left to report; a failing log must not take the caller with it.
	::fprintf(stderr, "log :%s\n", e.what());
}

bool
devsync::log::can_skip(const level &lev)
{
	if(console_enabled(lev))
		return false;

	const std::lock_guard<std::mutex> lock
	{
		devsync::log::mutex
	};

	return hook::list.empty();
}

void
devsync::log::flush()
{
	const std::lock_guard<std::mutex> lock
	{
		devsync::log::mutex
	};

	std::cout << std::flush;
	std::cerr << std::flush;
}

bool
devsync::log::is_console_stderr(const level &lev)
noexcept
{
	return lev <= level::WARNING;
}

//
// console
//

void
devsync::log::console_enable()
{
	for(auto &enabled : console_enable_)
		enabled = true;
}

void
devsync::log::console_disable()
{
	for(auto &enabled : console_enable_)
		enabled = false;
}

void
devsync::log::console_enable(const level &lev)
{
	console_enable_.at(lev) = true;
}

void
devsync::log::console_disable(const level &lev)
{
	console_enable_.at(lev) = false;
}

bool
devsync::log::console_enabled(const level &lev)
{
	return console_enable_.at(lev);
}

//
// reflection
//

devsync::log::level
devsync::log::reflect(const string_view &l)
{
	if(l == "CRITICAL")  return level::CRITICAL;
	if(l == "ERROR")     return level::ERROR;
	if(l == "WARNING")   return level::WARNING;
	if(l == "NOTICE")    return level::NOTICE;
	if(l == "INFO")      return level::INFO;
	if(l == "DERROR")    return level::DERROR;
	if(l == "DWARNING")  return level::DWARNING;
	if(l == "DEBUG")     return level::DEBUG;

	throw devsync::error
	{
		"'%s' is not a recognized log level", l
	};
}

devsync::string_view
devsync::log::reflect(const level &lev)
{
	switch(lev)
	{
		case level::CRITICAL:  return "CRITICAL";
		case level::ERROR:     return "ERROR";
		case level::WARNING:   return "WARNING";
		case level::NOTICE:    return "NOTICE";
		case level::INFO:      return "INFO";
		case level::DERROR:    return "ERROR";
		case level::DWARNING:  return "WARNING";
		case level::DEBUG:     return "DEBUG";
		case level::_NUM_:     break;
	}

	return "??????";
}
