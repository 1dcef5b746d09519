/*
 * test_json.cpp
 *
 *  Created on: Sep 22, 2026
 */

#include <moxe/utils/json.hpp>
#include <moxe/core/moxe_exceptions.hpp>

#include <gtest/gtest.h>

namespace moxe
{
	TEST(TestJson, init_null)
	{
		Json j;
		EXPECT_TRUE(j.isNull());
		EXPECT_TRUE(j.isEmpty());
		EXPECT_EQ(j.size(), 0);
	}
	TEST(TestJson, init_primitives)
	{
		EXPECT_TRUE(Json(true).getBool());
		EXPECT_EQ(Json(1234).getInt(), 1234);
		EXPECT_EQ(Json(0.001).getDouble(), 0.001);
		EXPECT_EQ(Json("text").getString(), "text");
		EXPECT_EQ(Json(std::string("text")).getString(), "text");
		EXPECT_EQ(Json(1234).size(), 1);
	}
	TEST(TestJson, wrong_type)
	{
		EXPECT_THROW(Json("text").getDouble(), JsonTypeError);
		EXPECT_THROW(Json(1.0).getBool(), JsonTypeError);
		EXPECT_THROW(Json(true).getString(), JsonTypeError);
		EXPECT_THROW(Json().getInt(), JsonTypeError);
	}
	TEST(TestJson, init_array)
	{
		Json j( { 0, 1, 2, 3 });
		EXPECT_TRUE(j.isArray());
		EXPECT_EQ(j.size(), 4);
		EXPECT_EQ(j[3].getInt(), 3);

		const int list[3] = { 4, 5, 6 };
		Json j2(list, 3);
		EXPECT_TRUE(j2.isArray());
		EXPECT_EQ(j2[2].getInt(), 6);
	}
	TEST(TestJson, array_from_null)
	{
		Json j;
		j[0] = 1;
		EXPECT_TRUE(j.isArray());
		EXPECT_EQ(j.size(), 1);

		j[3] = 3;
		EXPECT_EQ(j.size(), 4);
		EXPECT_TRUE(j[2].isNull());
	}
	TEST(TestJson, const_array_access)
	{
		const Json j( { 0, 1, 2 });
		EXPECT_EQ(j[1].getInt(), 1);
		EXPECT_THROW(j[3], IndexOutOfBounds);
	}
	TEST(TestJson, init_object)
	{
		Json j( { { "key", 0.5 }, { "name", "js" } });
		EXPECT_TRUE(j.isObject());
		EXPECT_EQ(j.size(), 2);
		EXPECT_TRUE(j.hasKey("key"));
		EXPECT_FALSE(j.hasKey("eps"));
		EXPECT_EQ(j["name"].getString(), "js");
		EXPECT_EQ(j.entry(0).first, "key");
	}
	TEST(TestJson, object_from_null)
	{
		Json j;
		j["key"] = 1;
		EXPECT_TRUE(j.isObject());
		EXPECT_EQ(j.size(), 1);
		j["key"] = "value";
		EXPECT_EQ(j.size(), 1);
		EXPECT_EQ(j["key"].getString(), "value");
	}
	TEST(TestJson, missing_key)
	{
		const Json j( { { "key", 1 } });
		EXPECT_THROW(j["other"], JsonKeyError);
		EXPECT_EQ(j.find("other"), nullptr);
		EXPECT_NE(j.find("key"), nullptr);
	}

	TEST(TestJson, dump_primitives)
	{
		EXPECT_EQ(Json().dump(), "null");
		EXPECT_EQ(Json(true).dump(), "true");
		EXPECT_EQ(Json(false).dump(), "false");
		EXPECT_EQ(Json(12345).dump(), "12345");
		EXPECT_EQ(Json(12.0).dump(), "12");
		EXPECT_EQ(Json(0.5).dump(), "0.5");
		EXPECT_EQ(Json("text").dump(), "\"text\"");
	}
	TEST(TestJson, dump_array)
	{
		EXPECT_EQ(Json(JsonType::Array).dump(), "[]");
		Json j( { 0, 1, 2 });
		EXPECT_EQ(j.dump(), "[0,1,2]");
		EXPECT_EQ(j.dump(2), "[\n  0,\n  1,\n  2\n]");
	}
	TEST(TestJson, dump_object)
	{
		EXPECT_EQ(Json(JsonType::Object).dump(), "{}");
		Json j( { { "text", 1 }, { "key", true } });
		EXPECT_EQ(j.dump(), "{\"text\":1,\"key\":true}");
		EXPECT_EQ(j.dump(2), "{\n  \"text\": 1,\n  \"key\": true\n}");
	}

	TEST(TestJson, load_primitives)
	{
		EXPECT_TRUE(Json::load("null").isNull());
		EXPECT_TRUE(Json::load("true").getBool());
		EXPECT_FALSE(Json::load(" false ").getBool());
		EXPECT_EQ(Json::load("123.43").getDouble(), 123.43);
		EXPECT_EQ(Json::load("-1e-3").getDouble(), -0.001);
		EXPECT_EQ(Json::load("\"some text\"").getString(), "some text");
	}
	TEST(TestJson, load_array)
	{
		Json j = Json::load("[123, true, null, 0.0]");
		EXPECT_TRUE(j.isArray());
		EXPECT_EQ(j.size(), 4);
		EXPECT_EQ(j[0].getInt(), 123);
		EXPECT_TRUE(j[1].getBool());
		EXPECT_TRUE(j[2].isNull());
		EXPECT_EQ(j[3].getDouble(), 0.0);
		EXPECT_TRUE(Json::load("[ ]").isEmpty());
	}
	TEST(TestJson, load_object)
	{
		Json j = Json::load("{\"num_experts\": 8, \"group_loss\": \"kl\", \"monitored_layers\": [0, 2]}");
		EXPECT_TRUE(j.isObject());
		EXPECT_EQ(j["num_experts"].getInt(), 8);
		EXPECT_EQ(j["group_loss"].getString(), "kl");
		EXPECT_EQ(j["monitored_layers"].size(), 2);
		EXPECT_TRUE(Json::load("{}").isEmpty());
	}
	TEST(TestJson, load_dumped)
	{
		Json j( { { "a", 1 }, { "b", Json( { 1.5, 2.5 }) }, { "c", "text" } });
		const Json loaded = Json::load(j.dump(2));
		EXPECT_EQ(loaded.dump(), j.dump());
	}
	TEST(TestJson, load_errors)
	{
		EXPECT_THROW(Json::load(""), JsonParsingError);
		EXPECT_THROW(Json::load("[1, 2"), JsonParsingError);
		EXPECT_THROW(Json::load("{\"key\" 1}"), JsonParsingError);
		EXPECT_THROW(Json::load("\"unterminated"), JsonParsingError);
		EXPECT_THROW(Json::load("nothing"), JsonParsingError);
		EXPECT_THROW(Json::load("1 2"), JsonParsingError);
	}

} /* namespace moxe */
