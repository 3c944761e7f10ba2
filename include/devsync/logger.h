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
#define HAVE_DEVSYNC_LOGGER_H

/// Logging system
namespace devsync::log
{
	enum level :uint;
	struct log;
	struct vlog;
	struct logf;
	struct hook;

	struct critical;
	struct error;
	struct derror;
	struct warning;
	struct dwarning;
	struct notice;
	struct info;
	struct debug;

	string_view reflect(const level &);
	level reflect(const string_view &);

	// This suite adjusts the output for an entire level.
	bool console_enabled(const level &);
	void console_disable(const level &);
	void console_enable(const level &);
	void console_disable();
	void console_enable();

	bool can_skip(const level &);
	void flush();

	extern log general;  // "devsync", 'G'
}

/// Severity level; zero is the most severe. Frequency and verbosity also tends
/// to increase as the log level increases.
enum devsync::log::level
:uint
{
	CRITICAL  = 0,  ///< Catastrophic/unrecoverable; program is in a compromised state.
	ERROR     = 1,  ///< Things that shouldn't happen; user impacted and should know.
	WARNING   = 2,  ///< Non-impacting undesirable behavior user should know about.
	NOTICE    = 3,  ///< An infrequent important message with neutral or positive news.
	INFO      = 4,  ///< A more frequent message with good news.
	DERROR    = 5,  ///< An error but only worthy of developers in debug mode.
	DWARNING  = 6,  ///< A warning but only for developers in debug mode.
	DEBUG     = 7,  ///< Maximum verbosity for developers.
	_NUM_
};

/// A named logger. Create an instance of this to help categorize log messages.
/// All messages sent to this logger will be prefixed with the given name.
/// The recommended duration of this class is static.
struct devsync::log::log
{
	string_view name;                  // name of this logger
	char snote;                        // mask character

  public:
	template<class... args> void operator()(const level &, const string_view &fmt, args&&...);

	log(const string_view &name, const char &snote = '\0');
	log(log &&) = delete;
	log(const log &) = delete;
};

/// log::hook is used by the receivers of messages. Each callback sees the
/// rendered line of every message which passed the level filter. Callbacks
/// are invoked under the output lock; they must not log.
struct devsync::log::hook
{
	using function = std::function<void (const log &, const level &, const string_view &)>;

	struct callback;

	static std::list<callback *> list;
};

/// Registers a listener for the duration of this object.
struct devsync::log::hook::callback
{
	function func;

	callback(function);
	callback(callback &&) = delete;
	callback(const callback &) = delete;
	~callback() noexcept;
};

/// Lower level interface; this is not a template and defined in the unit.
struct devsync::log::vlog
{
	vlog(const log &log, const level &, const string_view &msg) noexcept;
};

/// Lower level interface; allows log facility and level to be specified at
/// runtime.
struct devsync::log::logf
{
	template<class... args>
	logf(const log &log, const level &level, const string_view &fmt, args&&... a)
	{
		if(can_skip(level))
			return;

		vlog(log, level, fmt::format(fmt, std::forward<args>(a)...));
	}
};

#define DEVSYNC_LOG_LEVEL(_LEVEL_, _NAME_)                                    \
struct devsync::log::_NAME_                                                   \
{                                                                             \
    template<class... args>                                                   \
    _NAME_(const log &log, const string_view &fmt, args&&... a)               \
    {                                                                         \
        logf(log, level::_LEVEL_, fmt, std::forward<args>(a)...);             \
    }                                                                         \
                                                                              \
    template<class... args>                                                   \
    _NAME_(const string_view &fmt, args&&... a)                               \
    {                                                                         \
        logf(general, level::_LEVEL_, fmt, std::forward<args>(a)...);         \
    }                                                                         \
};

DEVSYNC_LOG_LEVEL(CRITICAL, critical)
DEVSYNC_LOG_LEVEL(ERROR, error)
DEVSYNC_LOG_LEVEL(WARNING, warning)
DEVSYNC_LOG_LEVEL(NOTICE, notice)
DEVSYNC_LOG_LEVEL(INFO, info)
DEVSYNC_LOG_LEVEL(DERROR, derror)
DEVSYNC_LOG_LEVEL(DWARNING, dwarning)
DEVSYNC_LOG_LEVEL(DEBUG, debug)

template<class... args>
void
devsync::log::log::operator()(const level &l,
                              const string_view &fmt,
                              args&&... a)
{
	logf(*this, l, fmt, std::forward<args>(a)...);
}
