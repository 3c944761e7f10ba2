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

namespace devsync::m::id
{
	namespace qi = boost::spirit::qi;

	using iterator = const char *;
	using range = boost::iterator_range<iterator>;

	struct grammar;

	static const grammar &parser();
}

/// Just enough of the identifier grammar to split a user ID and refuse
/// what can't be one: '@' localpart ':' server_name, where the server name
/// is a DNS name, an IPv4 address or a bracketed IPv6 address, each with an
/// optional port.
struct devsync::m::id::grammar
{
	template<class attr = qi::unused_type>
	using rule = qi::rule<iterator, attr>;

	rule<> port;
	rule<> dns_name;
	rule<> ip6_literal;
	rule<> server_name;
	rule<> localpart;
	rule<std::pair<range, range>()> user;

	grammar();
};

devsync::m::id::grammar::grammar()
{
	port = qi::lit(':') >> qi::repeat(1, 5)[qi::digit];

	dns_name = +(qi::alnum | qi::char_("-."));

	ip6_literal = qi::lit('[') >> +(qi::xdigit | qi::char_(":.")) >> qi::lit(']');

	server_name = (ip6_literal | dns_name) >> -port;

	localpart = +(qi::print - qi::char_(':'));

	user =
	qi::lit('@')
	>> qi::raw[localpart]
	>> qi::lit(':')
	>> qi::raw[server_name]
	>> qi::eoi
	;
}

const devsync::m::id::grammar &
devsync::m::id::parser()
{
	static const grammar instance;
	return instance;
}

bool
devsync::m::id::valid_user(const string_view &id)
noexcept try
{
	std::pair<range, range> out;
	iterator start(id.data()), stop(id.data() + id.size());
	return qi::parse(start, stop, parser().user, out);
}
catch(const std::exception &e)
{
	return false;
}

bool
devsync::m::my(const id::user &user_id,
               const string_view &origin)
noexcept
{
	return user_id.host() == origin;
}

//
// id::user
//

devsync::m::id::user::user(const string_view &id)
:id{id}
{
	if(!valid_user(id))
		throw INVALID_MXID
		{
			"'%s' is not a valid user ID", id
		};
}

devsync::string_view
devsync::m::id::user::local()
const noexcept
{
	return split(id.substr(1), ':').first;
}

devsync::string_view
devsync::m::id::user::host()
const noexcept
{
	return split(id, ':').second;
}
