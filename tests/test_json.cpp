// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/json.h>

using namespace zen;


class JsonTest : public ::testing::Test
{
};


TEST_F(JsonTest, CompactSerialization)
{
    JsonValue jval(JsonValue::Type::object);
    jval.objectVal["detail"] = JsonValue("File \"q3.xlsx\" not found.\n");
    jval.objectVal["code"]   = JsonValue(404);
    jval.objectVal["tags"]   = JsonValue(std::vector<JsonValue>{JsonValue(true), JsonValue()});

    EXPECT_EQ(serializeJson(jval, "", ""), R"({"code":404,"detail":"File \"q3.xlsx\" not found.\n","tags":[true,null]})");
}


TEST_F(JsonTest, PrettySerialization)
{
    JsonValue jval(JsonValue::Type::object);
    jval.objectVal["status"] = JsonValue("healthy");
    jval.objectVal["protocols_available"] = JsonValue(std::vector<JsonValue>{JsonValue("ftp"), JsonValue("sftp")});

    EXPECT_EQ(serializeJson(jval, "\n", "  "),
              "{\n"
              "  \"protocols_available\": [\"ftp\", \"sftp\"],\n"
              "  \"status\": \"healthy\"\n"
              "}\n");
}


TEST_F(JsonTest, Parse)
{
    const JsonValue jval = parseJson(R"( { "port": 8080, "name": "brücke", "debug": false,
                                           "list": [1, "two", null], "nested": {"x": -1.5e3} } )");
    ASSERT_EQ(jval.type, JsonValue::Type::object);
    EXPECT_EQ(getPrimitiveFromJsonObject(jval, "port"), "8080");
    EXPECT_EQ(getPrimitiveFromJsonObject(jval, "name"), "br\xc3\xbc" "cke");
    EXPECT_EQ(getPrimitiveFromJsonObject(jval, "debug"), "false");
    EXPECT_FALSE(getPrimitiveFromJsonObject(jval, "list")); //not a primitive
    EXPECT_FALSE(getPrimitiveFromJsonObject(jval, "missing"));

    const JsonValue* jlist = getChildFromJsonObject(jval, "list");
    ASSERT_TRUE(jlist);
    ASSERT_EQ(jlist->arrayVal.size(), 3u);
    EXPECT_EQ(jlist->arrayVal[2].type, JsonValue::Type::null);

    const JsonValue* jnested = getChildFromJsonObject(jval, "nested");
    ASSERT_TRUE(jnested);
    EXPECT_EQ(getPrimitiveFromJsonObject(*jnested, "x"), "-1.5e3");
}


TEST_F(JsonTest, ParseErrorPosition)
{
    try
    {
        parseJson("{\n  \"port\": 80,\n  \"host\" \"x\"\n}");
        FAIL() << "JsonParsingError expected";
    }
    catch (const JsonParsingError& e)
    {
        EXPECT_EQ(e.row, 2u);
    }

    EXPECT_THROW(parseJson("[1, 2"), JsonParsingError);
    EXPECT_THROW(parseJson("{\"a\": tru}"), JsonParsingError);
    EXPECT_THROW(parseJson("{} trailing"), JsonParsingError);
}
