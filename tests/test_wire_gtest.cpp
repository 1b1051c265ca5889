// ==============================================================================
// test_wire_gtest.cpp - Тесты декодеров заголовков записей
// ==============================================================================
//
// KEY_BASIC_INFORMATION (16 байт) и KEY_VALUE_FULL_INFORMATION (20 байт):
// - буферы короче заголовка отвергаются (TruncatedHeader)
// - поля читаются в native порядке
// - ByteCursor не выходит за пределы буфера
//
// ==============================================================================

#include <gtest/gtest.h>
#include <ntreg/wire.hpp>
#include <string>

namespace ntreg::test {

// ============================================================================
// KEY_BASIC_INFORMATION
// ============================================================================

TEST(WireTest, KeyHeader_AllShortLengths_TruncatedHeader) {
    for (std::size_t n = 0; n < KEY_BASIC_HEADER_SIZE; ++n) {
        // Arrange
        RawRecord raw(n, 0xAB);

        // Act
        auto result = decode_key_basic_header(raw);

        // Assert
        auto* err = std::get_if<RegError>(&result);
        ASSERT_NE(err, nullptr) << "length " << n;
        EXPECT_EQ(err->kind, RegErrorKind::TruncatedHeader) << "length " << n;
        EXPECT_TRUE(err->is_decode());
    }
}

TEST(WireTest, KeyHeader_ExactSize_DecodesFields) {
    // Arrange
    KeyBasicHeader in;
    in.last_write_time = 0x01D9A1B2C3D4E5F6ULL;
    in.title_index = 7;
    in.name_length = 6;
    RawRecord raw;
    encode_key_basic_header(in, raw);
    ASSERT_EQ(raw.size(), KEY_BASIC_HEADER_SIZE);

    // Act
    auto result = decode_key_basic_header(raw);

    // Assert
    auto* header = std::get_if<KeyBasicHeader>(&result);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->last_write_time, in.last_write_time);
    EXPECT_EQ(header->title_index, 7u);
    EXPECT_EQ(header->name_length, 6u);
}

TEST(WireTest, KeyHeader_NullPointer_TruncatedHeader) {
    auto result = decode_key_basic_header(nullptr, 64);
    auto* err = std::get_if<RegError>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, RegErrorKind::TruncatedHeader);
}

// ============================================================================
// KEY_VALUE_FULL_INFORMATION
// ============================================================================

TEST(WireTest, ValueHeader_AllShortLengths_TruncatedHeader) {
    for (std::size_t n = 0; n < VALUE_FULL_HEADER_SIZE; ++n) {
        RawRecord raw(n, 0x00);

        auto result = decode_value_full_header(raw);

        auto* err = std::get_if<RegError>(&result);
        ASSERT_NE(err, nullptr) << "length " << n;
        EXPECT_EQ(err->kind, RegErrorKind::TruncatedHeader) << "length " << n;
    }
}

TEST(WireTest, ValueHeader_FieldOrder) {
    // Arrange
    ValueFullHeader in;
    in.title_index = 1;
    in.value_type = 4;
    in.data_offset = 28;
    in.data_length = 4;
    in.name_length = 8;
    RawRecord raw;
    encode_value_full_header(in, raw);
    raw.resize(32, 0);

    // Act
    auto result = decode_value_full_header(raw);

    // Assert
    auto* header = std::get_if<ValueFullHeader>(&result);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->title_index, 1u);
    EXPECT_EQ(header->value_type, 4u);
    EXPECT_EQ(header->data_offset, 28u);
    EXPECT_EQ(header->data_length, 4u);
    EXPECT_EQ(header->name_length, 8u);
}

// ============================================================================
// ByteCursor
// ============================================================================

TEST(WireTest, ByteCursor_ReadPastEnd_ReturnsNullopt) {
    // Arrange
    RawRecord raw = {0x01, 0x00, 0x00, 0x00, 0xFF, 0xFF};
    ByteCursor cursor(raw);

    // Act
    auto first = cursor.read_u32();
    auto second = cursor.read_u32();

    // Assert
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 1u);
    EXPECT_FALSE(second.has_value());
    EXPECT_EQ(cursor.position(), 4u);
    EXPECT_EQ(cursor.remaining(), 2u);
}

TEST(WireTest, ByteCursor_ReadU64_NeedsEightBytes) {
    RawRecord raw(7, 0x11);
    ByteCursor cursor(raw);

    EXPECT_FALSE(cursor.read_u64().has_value());
    EXPECT_TRUE(cursor.skip(7));
    EXPECT_FALSE(cursor.skip(1));
    EXPECT_EQ(cursor.remaining(), 0u);
}

// ============================================================================
// Чтение заголовка с позиции курсора
// ============================================================================

TEST(WireTest, ReadValueHeader_CursorEndsMidHeader_HeaderReadError) {
    // Arrange: 20 байт, но курсор уже сдвинут на 8
    RawRecord raw(VALUE_FULL_HEADER_SIZE, 0x01);
    ByteCursor cursor(raw);
    ASSERT_TRUE(cursor.skip(8));

    // Act
    auto result = read_value_full_header(cursor);

    // Assert
    auto* err = std::get_if<RegError>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, RegErrorKind::HeaderReadError);
    EXPECT_NE(err->message.find("data_length"), std::string::npos) << err->message;
    EXPECT_EQ(cursor.remaining(), 0u);
}

TEST(WireTest, ReadKeyHeader_CursorEndsInNameLength_HeaderReadError) {
    RawRecord raw(14, 0x00);
    ByteCursor cursor(raw);

    auto result = read_key_basic_header(cursor);

    auto* err = std::get_if<RegError>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, RegErrorKind::HeaderReadError);
    EXPECT_NE(err->message.find("name_length"), std::string::npos) << err->message;
}

TEST(WireTest, ReadKeyHeader_SecondRecordInBuffer) {
    // Arrange: две записи подряд
    RawRecord raw;
    KeyBasicHeader first{1, 0, 4};
    KeyBasicHeader second{2, 0, 8};
    encode_key_basic_header(first, raw);
    encode_key_basic_header(second, raw);
    ByteCursor cursor(raw);
    ASSERT_TRUE(cursor.skip(KEY_BASIC_HEADER_SIZE));

    // Act
    auto result = read_key_basic_header(cursor);

    // Assert
    auto* header = std::get_if<KeyBasicHeader>(&result);
    ASSERT_NE(header, nullptr);
    EXPECT_EQ(header->last_write_time, 2u);
    EXPECT_EQ(header->name_length, 8u);
}

}  // namespace ntreg::test
