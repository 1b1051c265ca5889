// ==============================================================================
// test_app_gtest.cpp - Тесты выполнения команд на MemoryTransport
// ==============================================================================
//
// Вывод команд направляется в временный файл (-o) и разбирается обратно.
//
// ==============================================================================

#include <ntreg/app.hpp>
#include <ntreg/platform.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <sstream>
#include <string>

namespace ntreg::app::test {

// ============================================================================
// Test Fixture
// ============================================================================

class AppTest : public ::testing::Test {
protected:
    void SetUp() override {
        out_path_ = platform::make_temp_file("ntreg_app");

        store_ = std::make_shared<MemoryTransport>();
        store_->create_key("\\Registry\\Machine\\Software\\Vendor\\Alpha");
        store_->create_key("\\Registry\\Machine\\Software\\Vendor\\Beta");
        store_->put_value("\\Registry\\Machine\\Software\\Vendor\\Alpha", u"Count", 4,
                          {0x39, 0x05, 0x00, 0x00});
        store_->put_value("\\Registry\\Machine\\Software\\Vendor\\Beta", u"Path", 1,
                          code_units_to_bytes(u"C:\\Tools", true));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(out_path_, ec);
    }

    /// Выполнить команду с выводом в файл и вернуть содержимое stdout
    int run(const cli::Command& command, output::Format format, std::string& stdout_text) {
        output::OutputConfig config;
        config.quiet = true;
        config.format = format;
        config.output_path = out_path_;
        int code = 0;
        {
            output::Writer writer(config);
            code = run_command(command, store_, writer);
        }
        std::ifstream in(out_path_, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        stdout_text = ss.str();
        return code;
    }

    std::filesystem::path out_path_;
    std::shared_ptr<MemoryTransport> store_;
};

// ============================================================================
// keys
// ============================================================================

TEST_F(AppTest, Keys_Json_ListsSubkeysWithPaths) {
    // Arrange
    std::string text;

    // Act
    int code = run(cli::KeysCommand{"\\Registry\\Machine\\Software\\Vendor"}, output::Format::Json,
                   text);

    // Assert
    EXPECT_EQ(code, 0);
    rapidjson::Document doc;
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError()) << text;
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 2u);
    EXPECT_STREQ(doc[0]["name"].GetString(), "Alpha");
    EXPECT_STREQ(doc[0]["path"].GetString(), "\\Registry\\Machine\\Software\\Vendor\\Alpha");
    EXPECT_TRUE(doc[0]["last_write_time"].IsUint64());
    EXPECT_STREQ(doc[1]["name"].GetString(), "Beta");
}

TEST_F(AppTest, Keys_Table) {
    std::string text;

    int code = run(cli::KeysCommand{"\\Registry\\Machine\\Software\\Vendor"}, output::Format::Std,
                   text);

    EXPECT_EQ(code, 0);
    EXPECT_NE(text.find("Last Write"), std::string::npos);
    EXPECT_NE(text.find("Alpha"), std::string::npos);
    EXPECT_NE(text.find("Beta"), std::string::npos);
}

TEST_F(AppTest, Keys_MissingKey_ExitOne) {
    std::string text;

    int code = run(cli::KeysCommand{"\\Registry\\Machine\\Nope"}, output::Format::Std, text);

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(text.empty());
}

// ============================================================================
// values / tree
// ============================================================================

TEST_F(AppTest, Values_Jsonl_OneObjectPerLine) {
    std::string text;

    int code = run(cli::ValuesCommand{"\\Registry\\Machine\\Software\\Vendor\\Alpha"},
                   output::Format::Jsonl, text);

    EXPECT_EQ(code, 0);
    EXPECT_EQ(text, "{\"name\":\"Count\",\"type\":\"REG_DWORD\",\"data\":1337}\n");
}

TEST_F(AppTest, Tree_Json_IncludesKeyPath) {
    std::string text;

    int code = run(cli::TreeCommand{"\\Registry\\Machine\\Software\\Vendor"}, output::Format::Json,
                   text);

    EXPECT_EQ(code, 0);
    rapidjson::Document doc;
    doc.Parse(text.c_str());
    ASSERT_FALSE(doc.HasParseError()) << text;
    ASSERT_EQ(doc.Size(), 2u);
    EXPECT_STREQ(doc[1]["key"].GetString(), "\\Registry\\Machine\\Software\\Vendor\\Beta");
    EXPECT_STREQ(doc[1]["type"].GetString(), "REG_SZ");
    EXPECT_STREQ(doc[1]["data"].GetString(), "C:\\Tools");
}

// ============================================================================
// set / delete-value / delete-key
// ============================================================================

TEST_F(AppTest, Set_ThenValuesShowsIt) {
    // Arrange
    std::string text;
    cli::SetCommand set{"\\Registry\\Machine\\Software\\Vendor\\Alpha", "Big",
                        cli::SetData(std::uint64_t{13371337})};

    // Act
    int set_code = run(set, output::Format::Std, text);
    int list_code = run(cli::ValuesCommand{"\\Registry\\Machine\\Software\\Vendor\\Alpha"},
                        output::Format::Jsonl, text);

    // Assert
    EXPECT_EQ(set_code, 0);
    EXPECT_EQ(list_code, 0);
    EXPECT_NE(text.find("{\"name\":\"Big\",\"type\":\"REG_QWORD\",\"data\":13371337}"),
              std::string::npos);
}

TEST_F(AppTest, Set_ReadOnlyKey_ExitOne) {
    store_->set_read_only("\\Registry\\Machine\\Software\\Vendor\\Alpha", true);
    std::string text;
    cli::SetCommand set{"\\Registry\\Machine\\Software\\Vendor\\Alpha", "X",
                        cli::SetData(std::string("y"))};

    EXPECT_EQ(run(set, output::Format::Std, text), 1);
}

TEST_F(AppTest, DeleteValue_Missing_ExitOne) {
    std::string text;

    int code = run(cli::DeleteValueCommand{"\\Registry\\Machine\\Software\\Vendor\\Alpha", "Nope"},
                   output::Format::Std, text);

    EXPECT_EQ(code, 1);
}

TEST_F(AppTest, DeleteKey_Leaf) {
    std::string text;

    int code = run(cli::DeleteKeyCommand{"\\Registry\\Machine\\Software\\Vendor\\Beta"},
                   output::Format::Std, text);

    EXPECT_EQ(code, 0);
    EXPECT_FALSE(store_->key_exists("\\Registry\\Machine\\Software\\Vendor\\Beta"));
    EXPECT_TRUE(store_->key_exists("\\Registry\\Machine\\Software\\Vendor\\Alpha"));
}

TEST_F(AppTest, Version_WrittenToStdout) {
    std::string text;

    int code = run(cli::VersionCommand{}, output::Format::Std, text);

    EXPECT_EQ(code, 0);
    EXPECT_EQ(text, "ntreg 0.3.0\n");
}

// ============================================================================
// open_transport / format_filetime
// ============================================================================

TEST(OpenTransportTest, MissingStore_Error) {
    cli::GlobalOptions global;
    global.store = std::filesystem::path("/nonexistent/ntreg/store.yml");

    auto transport = open_transport(global);

    auto* err = std::get_if<RegError>(&transport);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->kind, RegErrorKind::TransportFailure);
}

#ifndef _WIN32
TEST(OpenTransportTest, NoStoreOffWindows_Error) {
    cli::GlobalOptions global;

    auto transport = open_transport(global);

    auto* err = std::get_if<RegError>(&transport);
    ASSERT_NE(err, nullptr);
    EXPECT_NE(err->message.find("--store"), std::string::npos);
}
#endif

TEST(FormatFiletimeTest, KnownInstants) {
    EXPECT_EQ(format_filetime(0), "");
    EXPECT_EQ(format_filetime(116444736000000000ULL), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_filetime(132539328000000000ULL + 3723ULL * 10000000ULL),
              "2021-01-01T01:02:03Z");
    EXPECT_EQ(format_filetime(10000000ULL * 86400ULL), "1601-01-02T00:00:00Z");
}

}  // namespace ntreg::app::test
