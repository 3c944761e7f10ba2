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
#define HAVE_DEVSYNC_EXCEPTION_H

namespace devsync
{
	struct exception; // Root exception
}

/// The root exception type.
///
/// All exceptions in the project inherit from this type. We generally don't
/// have catch blocks on this type. Instead we use `devsync::error` to catch
/// project-specific exceptions.
///
/// The message is composed once at construction into a fixed buffer; what()
/// never allocates. The format string is printf-like (see devsync::fmt) and
/// arguments are type-safe.
struct devsync::exception
:virtual std::exception
{
	static constexpr const size_t &BUFSIZE
	{
		512UL
	};

  protected:
	DEVSYNC_OVERLOAD(generate_skip)

	char buf[BUFSIZE];

	ssize_t generate(const char *const &name, const string_view &msg) noexcept;
	template<class... args> ssize_t generate(const char *const &name, const string_view &fmt, args&&...) noexcept;

  public:
	const char *what() const noexcept override;

	exception(generate_skip_t = {}) noexcept
	{
		buf[0] = '\0';
	}

	exception(exception &&) = delete;
	exception(const exception &) = delete;
	exception &operator=(exception &&) = delete;
	exception &operator=(const exception &) = delete;
};

/// Exception generator convenience macro
///
/// To create an exception, invoke this macro in your header. Examples:
///
///    DEVSYNC_EXCEPTION(devsync::error, my_exception)
///    DEVSYNC_EXCEPTION(my_exception, my_specific_exception)
///
/// Then your catch sequence can look like the following:
///
///    catch(const my_specific_exception &e)
///    {
///        log::error{log, "something specifically bad happened: %s", e.what()};
///    }
///    catch(const my_exception &e)
///    {
///        log::error{log, "something generically bad happened: %s", e.what()};
///    }
///
/// Remember: the order of the catch blocks is important.
///
#define DEVSYNC_EXCEPTION(parent, name)                                       \
struct name                                                                   \
:parent                                                                       \
{                                                                             \
    template<class... args>                                                   \
    name(const string_view &fmt, args&&... ap) noexcept                       \
    :parent{generate_skip}                                                    \
    {                                                                         \
        generate(#name, fmt, std::forward<args>(ap)...);                      \
    }                                                                         \
                                                                              \
    name() noexcept                                                           \
    :parent{generate_skip}                                                    \
    {                                                                         \
        generate(#name, string_view{});                                       \
    }                                                                         \
                                                                              \
    name(generate_skip_t) noexcept                                            \
    :parent{generate_skip}                                                    \
    {                                                                         \
    }                                                                         \
};

namespace devsync
{
	/// Root error exception type. Inherit from this.
	/// List your own exception somewhere else (unless you're overhauling the
	/// core library). example, in your namespace:
	///
	/// DEVSYNC_EXCEPTION(devsync::error, error)
	///
	DEVSYNC_EXCEPTION(exception, error)             // throw devsync::error("something bad")
	DEVSYNC_EXCEPTION(error, user_error)            // throw devsync::user_error("something silly")
}
