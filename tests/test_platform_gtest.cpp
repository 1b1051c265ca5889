// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного слоя (GoogleTest)
// ==============================================================================

#include <ntreg/platform.hpp>

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace ntreg::platform::test {

// ==============================================================================
// os_name
// ==============================================================================

TEST(PlatformTest, OsName_ReturnsKnownName) {
    // Act
    std::string name = os_name();

    // Assert
    EXPECT_TRUE(name == "Windows" || name == "Linux" || name == "macOS") << name;
    EXPECT_EQ(os_name(), name);
}

// ==============================================================================
// Конвертация путей
// ==============================================================================

TEST(PlatformTest, PathConversion_RoundtripWithCyrillic) {
    // Arrange
    std::string original = "store/\xd1\x80\xd0\xb5\xd0\xb5\xd1\x81\xd1\x82\xd1\x80.yml";

    // Act
    std::filesystem::path p = path_from_utf8(original);
    std::string back = path_to_utf8(p);

    // Assert
    EXPECT_EQ(back, original);
    EXPECT_EQ(path_to_utf8(p.filename()), "\xd1\x80\xd0\xb5\xd0\xb5\xd1\x81\xd1\x82\xd1\x80.yml");
}

TEST(PlatformTest, PathConversion_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_TRUE(path_to_utf8(std::filesystem::path()).empty());
}

// ==============================================================================
// make_temp_file
// ==============================================================================

TEST(PlatformTest, MakeTempFile_CreatesDistinctFiles) {
    // Act
    auto a = make_temp_file("ntreg_tmp");
    auto b = make_temp_file("ntreg_tmp");

    // Assert
    EXPECT_NE(a, b);
    EXPECT_TRUE(std::filesystem::exists(a));
    EXPECT_TRUE(std::filesystem::exists(b));
    EXPECT_EQ(std::filesystem::file_size(a), 0u);

    std::error_code ec;
    std::filesystem::remove(a, ec);
    std::filesystem::remove(b, ec);
}

TEST(PlatformTest, IsTty_DoesNotThrow) {
    EXPECT_NO_THROW({
        (void)is_tty_stdout();
        (void)is_tty_stderr();
    });
}

}  // namespace ntreg::platform::test
