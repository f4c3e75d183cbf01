#include <gtest/gtest.h>
#include <agent-worker/util/json.hpp>

using namespace agentworker;

TEST(Json, ParseObjectKeepsOrder) {
    auto j = Json::parse(R"({"b":1,"a":"x","c":[true,null,2.5]})");
    ASSERT_TRUE(j.has_value());
    ASSERT_TRUE(j->is_object());
    ASSERT_EQ(j->members().size(), 3u);
    EXPECT_EQ(j->members()[0].first, "b");
    EXPECT_EQ((*j)["b"].as_int64(), 1);
    EXPECT_EQ((*j)["a"].as_string(), "x");
    auto& c = (*j)["c"].items();
    ASSERT_EQ(c.size(), 3u);
    EXPECT_TRUE(c[0].as_bool());
    EXPECT_TRUE(c[1].is_null());
    EXPECT_DOUBLE_EQ(c[2].as_number(), 2.5);
    EXPECT_EQ(j->dump(), R"({"b":1,"a":"x","c":[true,null,2.5]})");
}

TEST(Json, MissingKeysReadAsNull) {
    auto j = Json::parse(R"({"a":{}})");
    ASSERT_TRUE(j);
    EXPECT_TRUE((*j)["nope"].is_null());
    EXPECT_TRUE((*j)["a"]["deeper"]["still"].is_null());
    EXPECT_EQ((*j)["nope"].as_string("def"), "def");
    EXPECT_TRUE((*j)["a"].items().empty());
}

TEST(Json, StringEscapes) {
    auto j = Json::parse(R"(["line\nbreak \"q\" é 😀"])");
    ASSERT_TRUE(j);
    std::string s = j->items()[0].as_string();
    EXPECT_EQ(s, "line\nbreak \"q\" \xC3\xA9 \xF0\x9F\x98\x80");
    EXPECT_EQ(Json(std::string("a\"b\\c\x01")).dump(), "\"a\\\"b\\\\c\\u0001\"");
}

TEST(Json, RejectsMalformed) {
    EXPECT_FALSE(Json::parse(""));
    EXPECT_FALSE(Json::parse("{"));
    EXPECT_FALSE(Json::parse(R"({"a":1,})"));
    EXPECT_FALSE(Json::parse(R"({"a" 1})"));
    EXPECT_FALSE(Json::parse("[1] trailing"));
    EXPECT_FALSE(Json::parse("tru"));
    EXPECT_FALSE(Json::parse("-"));
}

TEST(Json, DepthLimit) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_FALSE(Json::parse(deep));
}

TEST(Json, IntegersDumpWithoutFraction) {
    Json j = Json::object();
    j.set("ts", Json(1700000000123LL)).set("neg", -4).set("f", 0.25);
    EXPECT_EQ(j.dump(), R"({"ts":1700000000123,"neg":-4,"f":0.25})");
    auto back = Json::parse(j.dump());
    ASSERT_TRUE(back);
    EXPECT_EQ((*back)["ts"].as_int64(), 1700000000123LL);
}

TEST(Json, SetReplacesExistingKey) {
    Json j;
    j.set("a", 1);
    j.set("a", "two");
    EXPECT_EQ(j.members().size(), 1u);
    EXPECT_EQ(j["a"].as_string(), "two");
}
