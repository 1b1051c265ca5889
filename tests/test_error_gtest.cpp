// ==============================================================================
// test_error_gtest.cpp - Тесты таксономии ошибок
// ==============================================================================

#include <gtest/gtest.h>
#include <ntreg/error.hpp>

namespace ntreg::test {

TEST(ErrorTest, FormatStatus_EightHexDigits) {
    EXPECT_EQ(format_status(0xC0000022), "0xc0000022");
    EXPECT_EQ(format_status(0), "0x00000000");
}

TEST(ErrorTest, KnownStatuses_MapToKinds) {
    struct Case {
        std::uint32_t status;
        RegErrorKind kind;
    };
    const Case cases[] = {
        {STATUS_ACCESS_DENIED, RegErrorKind::AccessDenied},
        {STATUS_INVALID_HANDLE, RegErrorKind::InvalidHandle},
        {STATUS_INSUFFICIENT_RESOURCES, RegErrorKind::InsufficientResources},
        {STATUS_OBJECT_NAME_NOT_FOUND, RegErrorKind::NameNotFound},
        {STATUS_CANNOT_DELETE, RegErrorKind::TransportFailure},
    };

    for (const auto& c : cases) {
        auto err = error_from_status("delete_key", "\\Registry\\Machine\\Test", c.status);

        EXPECT_EQ(err.kind, c.kind) << format_status(c.status);
        EXPECT_EQ(err.status, c.status);
        EXPECT_EQ(err.operation, "delete_key");
        EXPECT_EQ(err.resource, "\\Registry\\Machine\\Test");
        EXPECT_TRUE(err.is_transport());
    }
}

TEST(ErrorTest, OpenFailure_MessageCarriesPathAndCode) {
    auto err = error_from_status("open", "\\Registry\\Machine\\Nope", STATUS_OBJECT_NAME_INVALID);

    EXPECT_EQ(err.kind, RegErrorKind::OpenFailed);
    EXPECT_EQ(err.format(),
              "Could not open registry key \\Registry\\Machine\\Nope error code 0xc0000033");
}

TEST(ErrorTest, OpenNotFound_KeepsStatusInMessage) {
    auto err = error_from_status("open", "\\Registry\\Machine\\Nope", STATUS_OBJECT_NAME_NOT_FOUND);

    EXPECT_EQ(err.kind, RegErrorKind::NameNotFound);
    EXPECT_NE(err.message.find("\\Registry\\Machine\\Nope"), std::string::npos);
    EXPECT_NE(err.message.find("0xc0000034"), std::string::npos);
}

TEST(ErrorTest, Categories_AreDisjoint) {
    auto decode = make_error(RegErrorKind::LengthMismatch, "x");
    auto text = make_error(RegErrorKind::NameConversion, "x");
    auto closed = make_error(RegErrorKind::HandleClosed, "x");

    EXPECT_TRUE(decode.is_decode());
    EXPECT_FALSE(decode.is_text());
    EXPECT_FALSE(decode.is_transport());
    EXPECT_TRUE(text.is_text());
    EXPECT_FALSE(text.is_decode());
    EXPECT_TRUE(closed.is_transport());
}

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(reg_error_kind_to_string(RegErrorKind::SmallNameBlob), "SmallNameBlob");
    EXPECT_STREQ(reg_error_kind_to_string(RegErrorKind::HandleClosed), "HandleClosed");
}

}  // namespace ntreg::test
