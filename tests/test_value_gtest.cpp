// ==============================================================================
// test_value_gtest.cpp - Тесты TypedValue и тегов типов
// ==============================================================================

#include <gtest/gtest.h>
#include <ntreg/value.hpp>
#include <rapidjson/document.h>

namespace ntreg::test {

// ============================================================================
// Теги типов
// ============================================================================

TEST(ValueTest, TypeTags_KnownAndUnknown) {
    EXPECT_EQ(value_type_from_u32(4), ValueType::Dword);
    EXPECT_EQ(value_type_from_u32(11), ValueType::Qword);
    EXPECT_EQ(value_type_from_u32(12), ValueType::Unknown);
    EXPECT_EQ(value_type_from_u32(99), ValueType::Unknown);
    EXPECT_STREQ(value_type_to_string(ValueType::ExpandString), "REG_EXPAND_SZ");
    EXPECT_STREQ(value_type_to_string(ValueType::Unknown), "REG_UNKNOWN");
}

TEST(ValueTest, TypeTagFromString) {
    EXPECT_EQ(value_type_tag_from_string("REG_SZ"), std::optional<std::uint32_t>(1));
    EXPECT_EQ(value_type_tag_from_string("REG_QWORD"), std::optional<std::uint32_t>(11));
    EXPECT_EQ(value_type_tag_from_string("99"), std::optional<std::uint32_t>(99));
    EXPECT_FALSE(value_type_tag_from_string("").has_value());
    EXPECT_FALSE(value_type_tag_from_string("reg_sz").has_value());
    EXPECT_FALSE(value_type_tag_from_string("4294967296").has_value());
}

// ============================================================================
// parse_hex_bytes
// ============================================================================

TEST(ValueTest, ParseHexBytes) {
    auto bytes = parse_hex_bytes("de AD\tbe ef");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));

    auto empty = parse_hex_bytes("");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    EXPECT_FALSE(parse_hex_bytes("abc").has_value());
    EXPECT_FALSE(parse_hex_bytes("0g").has_value());
}

// ============================================================================
// Представление
// ============================================================================

TEST(ValueTest, ToString) {
    EXPECT_EQ(TypedValue::make_string("hello").to_string(), "hello");
    EXPECT_EQ(TypedValue::make_dword(1337).to_string(), "1337");
    EXPECT_EQ(TypedValue::make_qword(13371337).to_string(), "13371337");
    EXPECT_EQ(TypedValue::make_binary({1, 2, 255}).to_string(), "[1, 2, 255]");
    EXPECT_EQ(TypedValue::make_none().to_string(), "? None");
    EXPECT_EQ(TypedValue::make_unknown().to_string(), "? Unknown");
}

TEST(ValueTest, Equality_ComparesKindAndPayload) {
    EXPECT_EQ(TypedValue::make_dword(1), TypedValue::make_dword(1));
    EXPECT_NE(TypedValue::make_dword(1), TypedValue::make_qword(1));
    EXPECT_EQ(TypedValue::make_unknown(), TypedValue::make_unknown());
    EXPECT_NE(TypedValue::make_none(), TypedValue::make_unknown());
}

TEST(ValueTest, ToRapidjson) {
    rapidjson::Document doc;
    auto& alloc = doc.GetAllocator();

    rapidjson::Value s;
    TypedValue::make_string("x").to_rapidjson(s, alloc);
    ASSERT_TRUE(s.IsString());
    EXPECT_STREQ(s.GetString(), "x");

    rapidjson::Value q;
    TypedValue::make_qword(0x1234567890ULL).to_rapidjson(q, alloc);
    ASSERT_TRUE(q.IsUint64());
    EXPECT_EQ(q.GetUint64(), 0x1234567890ULL);

    rapidjson::Value b;
    TypedValue::make_binary({7, 8}).to_rapidjson(b, alloc);
    ASSERT_TRUE(b.IsArray());
    ASSERT_EQ(b.Size(), 2u);
    EXPECT_EQ(b[1].GetUint(), 8u);

    rapidjson::Value u;
    TypedValue::make_unknown().to_rapidjson(u, alloc);
    EXPECT_TRUE(u.IsNull());
}

}  // namespace ntreg::test
