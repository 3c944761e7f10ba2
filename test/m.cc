// Matrix Construct
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2018 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#include <gtest/gtest.h>
#include "fixtures.h"

using namespace devsync;

TEST(m_id, user)
{
	const m::id::user user
	{
		"@alice:example.org:8448"
	};

	EXPECT_EQ(user.local(), "alice");
	EXPECT_EQ(user.host(), "example.org:8448");
	EXPECT_TRUE(m::my(user, "example.org:8448"));
	EXPECT_FALSE(m::my(user, "example.org"));

	EXPECT_EQ(m::id::user{"@b:[::1]"}.host(), "[::1]");
	EXPECT_TRUE(m::id::valid_user("@b:remote"));
	EXPECT_FALSE(m::id::valid_user("b:remote"));
	EXPECT_FALSE(m::id::valid_user("@b"));
	EXPECT_FALSE(m::id::valid_user("@:remote"));
	EXPECT_FALSE(m::id::valid_user("@b:"));
	EXPECT_FALSE(m::id::valid_user("@b:re mote"));
	EXPECT_THROW(m::id::user{"!room:remote"}, m::id::INVALID_MXID);
}

TEST(m_error, matrix_error_object)
{
	try
	{
		throw m::NOT_FOUND
		{
			"Device %s of %s not found", "D1", "@a:home"
		};
	}
	catch(const m::error &e)
	{
		EXPECT_EQ(e.code, http::NOT_FOUND);
		EXPECT_EQ(e.errcode(), "M_NOT_FOUND");
		EXPECT_EQ(e.errstr(), "Device D1 of @a:home not found");

		const json::object content{e.content};
		EXPECT_EQ(json::string(content.at("errcode")), "M_NOT_FOUND");
		EXPECT_NE(std::string(e.what()).find("M_NOT_FOUND"), std::string::npos);
	}
}

TEST(m_error, default_message_is_the_status)
{
	const m::FORBIDDEN e;
	EXPECT_EQ(e.code, http::FORBIDDEN);
	EXPECT_EQ(e.errstr(), "Forbidden");
	EXPECT_EQ(e.errcode(), "M_FORBIDDEN");
}

TEST(m_device_list_update, envelope)
{
	const m::device_list::update update
	{
		R"({"user_id":"@b:remote","device_id":"D9","stream_id":7,"prev_id":["5",6],"device_display_name":"Phone","keys":{"k":"v"}})"
	};

	EXPECT_EQ(update.user_id, "@b:remote");
	EXPECT_EQ(update.device_id, "D9");
	EXPECT_EQ(update.stream_id, "7");
	EXPECT_EQ(update.prev_id, (std::vector<std::string>{"5", "6"}));
	EXPECT_FALSE(update.deleted);

	const json::object content{update.content};
	EXPECT_EQ(content.size(), 2UL);
	EXPECT_EQ(json::string(content.at("device_display_name")), "Phone");
	EXPECT_EQ(json::type(content.at("keys")), json::OBJECT);
}

TEST(m_device_list_update, deleted_flag)
{
	EXPECT_TRUE(m::device_list::update(R"({"user_id":"@b:remote","device_id":"D9","stream_id":"7","deleted":true})").deleted);
	EXPECT_FALSE(m::device_list::update(R"({"user_id":"@b:remote","device_id":"D9","stream_id":"7","deleted":false})").deleted);
	EXPECT_FALSE(m::device_list::update(R"({"user_id":"@b:remote","device_id":"D9","stream_id":"7","deleted":"true"})").deleted);

	// deleted is device content, not envelope; it is cached as sent.
	const m::device_list::update kept
	{
		R"({"user_id":"@b:remote","device_id":"D9","stream_id":"7","deleted":false,"keys":{}})"
	};

	const json::object content{kept.content};
	EXPECT_EQ(content.size(), 2UL);
	EXPECT_EQ(json::string(content.at("deleted")), "false");
}

TEST(m_device_list_update, reflect_result)
{
	EXPECT_EQ(m::device_list::reflect(m::device_list::engine::IGNORED), "IGNORED");
	EXPECT_EQ(m::device_list::reflect(m::device_list::engine::INCREMENTAL), "INCREMENTAL");
	EXPECT_EQ(m::device_list::reflect(m::device_list::engine::RESYNC), "RESYNC");
}

TEST(m_device_list_update, envelope_violations)
{
	EXPECT_THROW(m::device_list::update("{}"), m::BAD_JSON);
	EXPECT_THROW(m::device_list::update("nonsense"), m::BAD_JSON);
	EXPECT_THROW(m::device_list::update(R"({"user_id":"@b:remote","device_id":"D9","stream_id":[]})"), m::BAD_JSON);
	EXPECT_THROW(m::device_list::update(R"({"user_id":"@b:remote","device_id":"D9","stream_id":"7","prev_id":{}})"), m::BAD_JSON);
}

TEST(m_fed_dispatcher, registry)
{
	test::transport transport;
	std::vector<std::string> seen;
	transport.register_edu_handler("m.test", [&seen](const string_view &origin, const string_view &content)
	-> m::fed::transport::edu_task
	{
		seen.emplace_back(std::string(origin) + " " + std::string(content));
		return {};
	});

	EXPECT_TRUE(transport.handles_edu("m.test"));
	EXPECT_FALSE(transport.handles_edu("m.other"));
	EXPECT_THROW(transport.register_edu_handler("m.test", {}), m::fed::error);

	transport.on_edu("remote", "m.test", "{}");
	transport.on_edu("remote", "m.other", "{}");
	EXPECT_EQ(seen, std::vector<std::string>{"remote {}"});

	transport.unregister_edu_handler("m.test");
	EXPECT_FALSE(transport.handles_edu("m.test"));
	transport.on_edu("remote", "m.test", "{}");
	EXPECT_EQ(seen.size(), 1UL);
}

TEST(m_fed_dispatcher, synchronous_failure_reaches_the_receiver)
{
	test::transport transport;
	transport.register_edu_handler("m.test", [](const string_view &, const string_view &)
	-> m::fed::transport::edu_task
	{
		throw m::fed::error{"handler failed"};
	});

	EXPECT_THROW(transport.on_edu("remote", "m.test", "{}"), m::fed::error);

	transport.unregister_edu_handler("m.test");
	transport.register_edu_handler("m.test", [](const string_view &, const string_view &)
	-> m::fed::transport::edu_task
	{
		return []
		{
			throw m::fed::error{"task failed"};
		};
	});

	EXPECT_THROW(transport.on_edu("remote", "m.test", "{}"), m::fed::error);
}

TEST(m_fed_dispatcher, task_follows_handler)
{
	test::transport transport;
	std::vector<std::string> seen;
	transport.register_edu_handler("m.test", [&seen](const string_view &, const string_view &content)
	-> m::fed::transport::edu_task
	{
		seen.emplace_back("admit " + std::string(content));
		return [&seen, content(std::string(content))]
		{
			seen.emplace_back("task " + content);
		};
	});

	transport.on_edu("remote", "m.test", "1");
	transport.on_edu("remote", "m.test", "2");
	EXPECT_EQ(seen, (std::vector<std::string>{"admit 1", "task 1", "admit 2", "task 2"}));
}

TEST(m_fed_dispatcher, async_handler_runs_on_the_receiver)
{
	test::transport transport{m::fed::dispatcher::async};
	std::mutex mutex;
	std::vector<std::string> admitted;
	size_t done {0};
	const auto receiver
	{
		std::this_thread::get_id()
	};

	transport.register_edu_handler("m.test", [&](const string_view &, const string_view &content)
	-> m::fed::transport::edu_task
	{
		EXPECT_EQ(std::this_thread::get_id(), receiver);
		admitted.emplace_back(content);
		return [&]
		{
			const std::lock_guard<std::mutex> lock{mutex};
			++done;
		};
	});

	for(const auto &content : {"1", "2", "3", "4", "5", "6"})
		transport.on_edu("remote", "m.test", content);

	transport.wait();
	EXPECT_EQ(admitted, (std::vector<std::string>{"1", "2", "3", "4", "5", "6"}));
	EXPECT_EQ(done, 6UL);
}

TEST(m_fed_dispatcher, queries)
{
	test::transport transport;
	transport.register_query_handler("echo", [](const string_view &args) -> std::string
	{
		return std::string(args);
	});

	EXPECT_EQ(transport.on_query("echo", R"({"a":1})"), R"({"a":1})");
	EXPECT_THROW(transport.on_query("nope", "{}"), m::NOT_FOUND);
	transport.unregister_query_handler("echo");
	EXPECT_FALSE(transport.handles_query("echo"));
}
