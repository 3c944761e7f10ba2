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
#define HAVE_DEVSYNC_JSON_H

/// JavaScript Object Notation: formal grammars & tools
///
/// Input is never copied into a tree. json::object and json::array are views
/// over serialized text which must outlive them; each exposes its members as
/// sub-views, and values are decoded only on request. Output is composed into
/// a json::strung (an std::string of serialized json) from json::members.
///
namespace devsync::json
{
	DEVSYNC_EXCEPTION(devsync::error, error);
	DEVSYNC_EXCEPTION(error, parse_error);
	DEVSYNC_EXCEPTION(error, type_error);
	DEVSYNC_EXCEPTION(error, not_found);

	enum type :uint8_t;
	struct object;
	struct array;
	struct value;
	struct member;
	struct strung;
	using members = std::initializer_list<member>;

	enum type type(const string_view &) noexcept;
	string_view reflect(const enum type &) noexcept;
	bool valid(const string_view &) noexcept;

	// Decodes a json::STRING; any other type is returned as its text, which
	// suits opaque tokens that may be either a string or a number.
	std::string string(const string_view &);

	std::string escape(const string_view &);
	std::string quote(const string_view &);
}

enum devsync::json::type
:uint8_t
{
	STRING  = 0,
	OBJECT  = 1,
	ARRAY   = 2,
	NUMBER  = 3,
	LITERAL = 4,
};

/// View over a serialized object. The members are sliced out at construction;
/// a malformed input throws parse_error.
struct devsync::json::object
{
	using member = std::pair<std::string, string_view>;
	using const_iterator = std::vector<member>::const_iterator;

	string_view text;
	std::vector<member> members;

  public:
	const_iterator begin() const noexcept        { return members.begin();                          }
	const_iterator end() const noexcept          { return members.end();                            }
	size_t size() const noexcept                 { return members.size();                           }
	bool empty() const noexcept                  { return members.empty();                          }
	explicit operator string_view() const        { return text;                                     }

	const_iterator find(const string_view &key) const;
	bool has(const string_view &key) const;
	string_view get(const string_view &key, const string_view &def = {}) const;
	string_view at(const string_view &key) const;

	object(const string_view &text);
	object() = default;
};

/// View over a serialized array.
struct devsync::json::array
{
	using const_iterator = std::vector<string_view>::const_iterator;

	string_view text;
	std::vector<string_view> values;

  public:
	const_iterator begin() const noexcept        { return values.begin();                           }
	const_iterator end() const noexcept          { return values.end();                             }
	size_t size() const noexcept                 { return values.size();                            }
	bool empty() const noexcept                  { return values.empty();                           }
	explicit operator string_view() const        { return text;                                     }

	string_view at(const size_t &i) const;

	array(const string_view &text);
	array() = default;
};

/// A value for composition; holds its serialized form.
struct devsync::json::value
{
	enum type type {LITERAL};
	std::string serial {"null"};

  public:
	value(const string_view &);
	value(const std::string &);
	value(const char *const &);
	value(const bool &);
	value(const double &);
	value(const strung &);
	value(const object &);
	value(const array &);
	value(const members &);
	value(const std::vector<value> &);

	template<class T,
	         typename std::enable_if<std::is_integral<T>() && !std::is_same<T, bool>(), int>::type = 0>
	value(const T &integer)
	:type{NUMBER}
	,serial{std::to_string(integer)}
	{}

	value() = default;
};

struct devsync::json::member
:std::pair<string_view, value>
{
	using std::pair<string_view, value>::pair;
};

/// Serialized json. Composing from members produces an object.
struct devsync::json::strung
:std::string
{
	strung(const members &);
	strung(const std::vector<member> &);
	strung(const object &);
	explicit strung(std::string serial);
	strung() = default;
};
