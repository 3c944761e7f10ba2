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
#define HAVE_DEVSYNC_CONF_H

/// Configuration system.
///
/// This system disseminates mutable runtime values throughout the project.
/// All users that integrate a configurable value will create a [static]
/// conf::item<> instantiated with one of the explicit types available; also a
/// name and default value.
///
/// All conf::items are collected by this system. Users that administrate
/// configuration will push values to the conf::item's. The various items have
/// O(1) access to the value contained in their item instance. Administrators
/// have logarithmic access through this interface using the items map by name.
///
/// All conf::items can be controlled by environmental variables at program
/// startup. The name of the conf::item in the environment uses underscore
/// '_' rather than '.' and the environment takes precedence over defaults.
///
/// Values are not synchronized; set them before the workers which read them
/// are started.
///
namespace devsync::conf
{
	template<class T = void> struct item;  // doesn't exist
	template<> struct item<void>;          // base class of all conf items
	template<> struct item<std::string>;
	template<> struct item<bool>;
	template<> struct item<uint64_t>;
	template<> struct item<int64_t>;
	template<> struct item<seconds>;
	template<> struct item<milliseconds>;

	template<class T> struct value;        // abstraction for carrying item value
	template<class T> struct lex_castable; // abstraction for lex_cast compatible

	DEVSYNC_EXCEPTION(devsync::error, error)
	DEVSYNC_EXCEPTION(error, not_found)
	DEVSYNC_EXCEPTION(error, bad_value)

	using set_cb = std::function<void ()>;

	std::map<string_view, item<> *> &items();

	bool exists(const string_view &key);
	std::string get(const string_view &key);
	bool set(const string_view &key, const string_view &value);
	bool set(std::nothrow_t, const string_view &key, const string_view &value);
	bool reset(std::nothrow_t, const string_view &key);
	bool reset(const string_view &key);
	size_t reset();
}

/// Conf item base class. You don't create this directly; use one of the
/// derived templates instead.
template<>
struct devsync::conf::item<void>
{
	static const size_t NAME_MAX_LEN;

	std::string name;
	std::string default_;
	conf::set_cb set_cb;

  protected:
	virtual std::string on_get() const = 0;
	virtual bool on_set(const string_view &) = 0;
	void call_init();

  public:
	std::string get() const;
	bool set(const string_view &);
	bool reset();

	item(const json::members &, conf::set_cb);
	item(item &&) = delete;
	item(const item &) = delete;
	virtual ~item() noexcept;
};

/// Conf item value abstraction. If possible, the conf item will also
/// inherit from this template to deduplicate functionality between
/// conf items which contain similar classes of values.
template<class T>
struct devsync::conf::value
{
	using value_type = T;

	T _value;

	operator const T &() const noexcept
	{
		return _value;
	}

	template<class... A>
	value(A&&... a)
	:_value(std::forward<A>(a)...)
	{}
};

template<class T>
struct devsync::conf::lex_castable
:conf::item<>
,conf::value<T>
{
	std::string on_get() const override
	{
		return lex_cast(this->_value);
	}

	bool on_set(const string_view &s) override
	{
		this->_value = lex_cast<T>(s);
		return true;
	}

	lex_castable(const json::members &members,
	             conf::set_cb set_cb = {})
	:conf::item<>
	{
		members, std::move(set_cb)
	}
	,conf::value<T>
	(
		lex_cast<T>(this->default_)
	)
	{
		call_init();
	}
};

template<>
struct devsync::conf::item<std::string>
:conf::item<>
,conf::value<std::string>
{
	explicit operator const std::string &() const
	{
		return _value;
	}

	operator string_view() const
	{
		return _value;
	}

	std::string on_get() const override;
	bool on_set(const string_view &s) override;

	item(const json::members &members, conf::set_cb set_cb = {});
};

template<>
struct devsync::conf::item<bool>
:conf::lex_castable<bool>
{
	bool operator!() const
	{
		return !static_cast<const bool &>(*this);
	}

	using lex_castable::lex_castable;
};

template<>
struct devsync::conf::item<uint64_t>
:conf::lex_castable<uint64_t>
{
	using lex_castable::lex_castable;
};

template<>
struct devsync::conf::item<int64_t>
:conf::lex_castable<int64_t>
{
	using lex_castable::lex_castable;
};

template<>
struct devsync::conf::item<devsync::seconds>
:conf::lex_castable<seconds>
{
	using lex_castable::lex_castable;
};

template<>
struct devsync::conf::item<devsync::milliseconds>
:conf::lex_castable<milliseconds>
{
	using lex_castable::lex_castable;
};
