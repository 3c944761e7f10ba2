// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <boost/spirit/include/qi.hpp>
#include <boost/fusion/include/std_pair.hpp>

namespace devsync::json
{
	namespace qi = boost::spirit::qi;

	using iterator = const char *;
	using range = boost::iterator_range<iterator>;

	struct grammar;

	static const grammar &parser();
	static void append_utf8(std::string &, const uint32_t &);
	static uint32_t parse_hex4(const string_view &);
}

/// Formal grammar of RFC 8259. Nothing is decoded; values are captured as
/// ranges of the input so a caller can slice a document without copying it.
struct devsync::json::grammar
{
	template<class attr = qi::unused_type>
	using rule = qi::rule<iterator, attr>;

	rule<> ws;
	rule<> escape;
	rule<> string;
	rule<> number;
	rule<> literal;
	rule<> sep;
	rule<> member;
	rule<> object;
	rule<> array;
	rule<> value;
	rule<> document;

	rule<std::pair<range, range>()> member_range;
	rule<std::vector<std::pair<range, range>>()> object_members;
	rule<std::vector<range>()> array_values;

	grammar();
};

devsync::json::grammar::grammar()
{
	ws = *qi::char_(" \t\r\n");

	escape = qi::lit('\\') >> (qi::char_("\"\\/bfnrt") | (qi::lit('u') >> qi::repeat(4)[qi::xdigit]));

	string = qi::lit('"') >> *(escape | ~qi::char_("\"\\")) >> qi::lit('"');

	number =
	-qi::lit('-')
	>> +qi::digit
	>> -(qi::lit('.') >> +qi::digit)
	>> -(qi::char_("eE") >> -qi::char_("+-") >> +qi::digit)
	;

	literal = qi::lit("true") | qi::lit("false") | qi::lit("null");

	sep = ws >> qi::lit(',') >> ws;

	member = string >> ws >> qi::lit(':') >> ws >> value;

	object = qi::lit('{') >> ws >> -(member % sep) >> ws >> qi::lit('}');

	array = qi::lit('[') >> ws >> -(value % sep) >> ws >> qi::lit(']');

	value = object | array | string | number | literal;

	document = ws >> value >> ws >> qi::eoi;

	member_range = qi::raw[string] >> ws >> qi::lit(':') >> ws >> qi::raw[value];

	object_members =
	ws >> qi::lit('{') >> ws
	>> -(member_range % sep)
	>> ws >> qi::lit('}') >> ws >> qi::eoi
	;

	array_values =
	ws >> qi::lit('[') >> ws
	>> -(qi::raw[value] % sep)
	>> ws >> qi::lit(']') >> ws >> qi::eoi
	;
}

const devsync::json::grammar &
devsync::json::parser()
{
	static const grammar instance;
	return instance;
}

//
// object
//

devsync::json::object::object(const string_view &text)
:text{text}
{
	if(text.empty())
		return;

	std::vector<std::pair<range, range>> out;
	iterator start(text.data()), stop(text.data() + text.size());
	if(!qi::parse(start, stop, parser().object_members, out))
		throw parse_error
		{
			"Invalid json object (%lu bytes) at offset %lu",
			text.size(),
			size_t(start - text.data()),
		};

	members.reserve(out.size());
	for(const auto &[key, val] : out)
		members.emplace_back
		(
			json::string(string_view{key.begin(), size_t(key.size())}),
			string_view{val.begin(), size_t(val.size())}
		);
}

devsync::json::object::const_iterator
devsync::json::object::find(const string_view &key)
const
{
	return std::find_if(begin(), end(), [&key]
	(const member &m)
	{
		return m.first == key;
	});
}

bool
devsync::json::object::has(const string_view &key)
const
{
	return find(key) != end();
}

devsync::string_view
devsync::json::object::get(const string_view &key,
                           const string_view &def)
const
{
	const auto it(find(key));
	return it != end()? it->second : def;
}

devsync::string_view
devsync::json::object::at(const string_view &key)
const
{
	const auto it(find(key));
	if(it == end())
		throw not_found
		{
			"'%s'", key
		};

	return it->second;
}

//
// array
//

devsync::json::array::array(const string_view &text)
:text{text}
{
	if(text.empty())
		return;

	std::vector<range> out;
	iterator start(text.data()), stop(text.data() + text.size());
	if(!qi::parse(start, stop, parser().array_values, out))
		throw parse_error
		{
			"Invalid json array (%lu bytes) at offset %lu",
			text.size(),
			size_t(start - text.data()),
		};

	values.reserve(out.size());
	for(const auto &val : out)
		values.emplace_back(val.begin(), size_t(val.size()));
}

devsync::string_view
devsync::json::array::at(const size_t &i)
const
{
	if(i >= values.size())
		throw not_found
		{
			"indice %lu out of range (size %lu)", i, values.size()
		};

	return values[i];
}

//
// value
//

devsync::json::value::value(const string_view &s)
:type{STRING}
,serial{quote(s)}
{}

devsync::json::value::value(const std::string &s)
:value{string_view{s}}
{}

devsync::json::value::value(const char *const &s)
:type{s? STRING : LITERAL}
,serial{s? quote(s) : "null"}
{}

devsync::json::value::value(const bool &b)
:type{LITERAL}
,serial{b? "true" : "false"}
{}

devsync::json::value::value(const double &d)
:type{NUMBER}
,serial{lex_cast(d)}
{}

devsync::json::value::value(const strung &s)
:type{json::type(s)}
,serial{s.empty()? std::string{"null"} : std::string{s}}
{}

devsync::json::value::value(const object &o)
:type{OBJECT}
,serial{o.text.empty()? "{}" : o.text}
{}

devsync::json::value::value(const array &a)
:type{ARRAY}
,serial{a.text.empty()? "[]" : a.text}
{}

devsync::json::value::value(const members &m)
:type{OBJECT}
,serial{strung{m}}
{}

devsync::json::value::value(const std::vector<value> &v)
:type{ARRAY}
{
	serial = "[";
	for(auto it(begin(v)); it != end(v); ++it)
	{
		if(it != begin(v))
			serial.push_back(',');

		serial.append(it->serial);
	}

	serial.push_back(']');
}

//
// strung
//

namespace devsync::json
{
	template<class it>
	static std::string serialize_members(const it &, const it &);
}

template<class it>
std::string
devsync::json::serialize_members(const it &b,
                                 const it &e)
{
	std::string ret{"{"};
	for(auto i(b); i != e; ++i)
	{
		if(i != b)
			ret.push_back(',');

		ret.append(quote(i->first));
		ret.push_back(':');
		ret.append(i->second.serial);
	}

	ret.push_back('}');
	return ret;
}

devsync::json::strung::strung(const members &m)
:std::string
{
	serialize_members(m.begin(), m.end())
}
{}

devsync::json::strung::strung(const std::vector<member> &m)
:std::string
{
	serialize_members(m.begin(), m.end())
}
{}

devsync::json::strung::strung(const object &o)
:std::string
{
	o.text.empty()? string_view{"{}"} : o.text
}
{}

devsync::json::strung::strung(std::string serial)
:std::string
{
	std::move(serial)
}
{}

//
// tools
//

enum devsync::json::type
devsync::json::type(const string_view &text)
noexcept
{
	const auto s
	{
		text.substr(std::min(text.find_first_not_of(" \t\r\n"), text.size()))
	};

	if(s.empty())
		return LITERAL;

	switch(s.front())
	{
		case '"':  return STRING;
		case '{':  return OBJECT;
		case '[':  return ARRAY;
		case '-':  return NUMBER;
		default:   break;
	}

	return std::isdigit(uint8_t(s.front()))? NUMBER : LITERAL;
}

devsync::string_view
devsync::json::reflect(const enum type &type)
noexcept
{
	switch(type)
	{
		case STRING:   return "STRING";
		case OBJECT:   return "OBJECT";
		case ARRAY:    return "ARRAY";
		case NUMBER:   return "NUMBER";
		case LITERAL:  return "LITERAL";
	}

	return "??????";
}

bool
devsync::json::valid(const string_view &text)
noexcept try
{
	iterator start(text.data()), stop(text.data() + text.size());
	return qi::parse(start, stop, parser().document);
}
catch(const std::exception &e)
{
	return false;
}

std::string
devsync::json::string(const string_view &text)
{
	const auto begin_
	{
		text.find_first_not_of(" \t\r\n")
	};

	const auto end_
	{
		text.find_last_not_of(" \t\r\n")
	};

	if(begin_ == text.npos)
		return {};

	const string_view s
	{
		text.substr(begin_, end_ - begin_ + 1)
	};

	if(s.front() != '"')
		return std::string{s};

	if(s.size() < 2 || s.back() != '"')
		throw type_error
		{
			"Unterminated json string"
		};

	std::string ret;
	ret.reserve(s.size() - 2);
	for(size_t i(1); i < s.size() - 1; ++i)
	{
		if(s[i] != '\\')
		{
			ret.push_back(s[i]);
			continue;
		}

		if(++i >= s.size() - 1)
			throw type_error
			{
				"Truncated escape sequence in json string"
			};

		switch(s[i])
		{
			case '"':   ret.push_back('"');   break;
			case '\\':  ret.push_back('\\');  break;
			case '/':   ret.push_back('/');   break;
			case 'b':   ret.push_back('\b');  break;
			case 'f':   ret.push_back('\f');  break;
			case 'n':   ret.push_back('\n');  break;
			case 'r':   ret.push_back('\r');  break;
			case 't':   ret.push_back('\t');  break;
			case 'u':
			{
				if(i + 4 >= s.size())
					throw type_error
					{
						"Truncated unicode escape in json string"
					};

				uint32_t cp(parse_hex4(s.substr(i + 1, 4)));
				i += 4;

				// Surrogate pair
				if(cp >= 0xD800 && cp <= 0xDBFF && i + 6 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u')
				{
					const uint32_t lo(parse_hex4(s.substr(i + 3, 4)));
					if(lo >= 0xDC00 && lo <= 0xDFFF)
					{
						cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
						i += 6;
					}
				}

				append_utf8(ret, cp);
				break;
			}

			default:
				throw type_error
				{
					"Invalid escape '\\%c' in json string", s[i]
				};
		}
	}

	return ret;
}

std::string
devsync::json::quote(const string_view &s)
{
	std::string ret;
	ret.reserve(s.size() + 2);
	ret.push_back('"');
	ret.append(escape(s));
	ret.push_back('"');
	return ret;
}

std::string
devsync::json::escape(const string_view &s)
{
	std::string ret;
	ret.reserve(s.size());
	for(const char &c : s) switch(c)
	{
		case '"':   ret.append("\\\"");  break;
		case '\\':  ret.append("\\\\");  break;
		case '\b':  ret.append("\\b");   break;
		case '\f':  ret.append("\\f");   break;
		case '\n':  ret.append("\\n");   break;
		case '\r':  ret.append("\\r");   break;
		case '\t':  ret.append("\\t");   break;
		default:
		{
			if(uint8_t(c) >= 0x20)
			{
				ret.push_back(c);
				break;
			}

			char buf[8];
			::snprintf(buf, sizeof(buf), "\\u%04x", uint(uint8_t(c)));
			ret.append(buf);
			break;
		}
	}

	return ret;
}

uint32_t
devsync::json::parse_hex4(const string_view &s)
{
	uint32_t ret(0);
	for(const char &c : s)
	{
		ret <<= 4;
		if(c >= '0' && c <= '9')
			ret |= uint32_t(c - '0');
		else if(c >= 'a' && c <= 'f')
			ret |= uint32_t(c - 'a' + 10);
		else if(c >= 'A' && c <= 'F')
			ret |= uint32_t(c - 'A' + 10);
		else
			throw type_error
			{
				"Invalid unicode escape in json string"
			};
	}

	return ret;
}

void
devsync::json::append_utf8(std::string &out,
                           const uint32_t &cp)
{
	if(cp < 0x80)
		out.push_back(char(cp));
	else if(cp < 0x800)
	{
		out.push_back(char(0xC0 | (cp >> 6)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
	else if(cp < 0x10000)
	{
		out.push_back(char(0xE0 | (cp >> 12)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
	else
	{
		out.push_back(char(0xF0 | (cp >> 18)));
		out.push_back(char(0x80 | ((cp >> 12) & 0x3F)));
		out.push_back(char(0x80 | ((cp >> 6) & 0x3F)));
		out.push_back(char(0x80 | (cp & 0x3F)));
	}
}
