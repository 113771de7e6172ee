#include "sturdypatch/application/patcher_app.hpp"
#include "sturdypatch/io/file_system.hpp"
#include "sturdypatch/parsers/patch_parser.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

namespace sturdypatch {

class MockTerminalIntegration : public ITerminal {
public:
    MOCK_METHOD(bool, setup_raw_mode, (), (override));
    MOCK_METHOD(InputEvent, get_input_event, (), (override));
    MOCK_METHOD(void, display_screen, (const Screen& screen), (override));
    MOCK_METHOD(std::string, read_line, (), (override));
    MOCK_METHOD(bool, is_interactive, (), (override));
    MOCK_METHOD(void, restore_terminal_state, (), (override));
};

// Real parser and filesystem against a temporary directory
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto name = std::string("sturdypatch_it_")
                    + ::testing::UnitTest::GetInstance()->current_test_info()->name();
        work_dir_ = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove_all(work_dir_);
        std::filesystem::create_directories(work_dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(work_dir_, ec);
    }

    auto path(const std::string& name) const -> std::string { return (work_dir_ / name).string(); }

    void write_file(const std::string& name, const std::string& content) const
    {
        std::ofstream file(path(name), std::ios::binary);
        file << content;
    }

    auto read_file(const std::string& name) const -> std::string
    {
        std::ifstream file(path(name), std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    auto run(const Config& config) -> int
    {
        auto terminal = std::make_unique<testing::NiceMock<MockTerminalIntegration>>();
        ON_CALL(*terminal, is_interactive()).WillByDefault(testing::Return(false));

        PatcherApp app(std::move(terminal), std::make_unique<FileSystem>(),
                       std::make_unique<PatchParser>());

        std::streambuf* orig_out = std::cout.rdbuf(output_.rdbuf());
        std::streambuf* orig_err = std::cerr.rdbuf(errors_.rdbuf());

        int result = app.run(config);

        std::cout.rdbuf(orig_out);
        std::cerr.rdbuf(orig_err);
        return result;
    }

    auto batch_config() const -> Config
    {
        return Config{
            .target_file = path("server.py"),
            .patch_file = path("patch.json"),
            .interactive = false
        };
    }

    std::filesystem::path work_dir_;
    std::ostringstream output_;
    std::ostringstream errors_;

    const std::string source_ = "class Server:\r\n"
                                "\tdef start(self):\r\n"
                                "\t\tself.port = 80  \r\n"
                                "\t\tself.listen()\r\n"
                                "\r\n"
                                "\tdef stop(self):\r\n"
                                "\t\tpass";
};

TEST_F(IntegrationTest, PatchesFileAndKeepsFormatting)
{
    write_file("server.py", source_);
    write_file("patch.json", R"json({
        "hunks": [
            {
                "description": "Use alternate port",
                "search_block": "    self.port = 80\n    self.listen()\n",
                "replace_block": "    self.port = 8080\n    self.listen()\n    self.log('started')\n"
            },
            {
                "description": "Close on stop",
                "search_block": "pass",
                "replace_block": "self.close()"
            }
        ]
    })json");

    EXPECT_EQ(run(batch_config()), exit_success);

    EXPECT_EQ(read_file("server_v0.0.py"), "class Server:\r\n"
                                           "\tdef start(self):\r\n"
                                           "\t\tself.port = 8080\r\n"
                                           "\t\tself.listen()\r\n"
                                           "\t\tself.log('started')\r\n"
                                           "\r\n"
                                           "\tdef stop(self):\r\n"
                                           "\t\tself.close()");
    EXPECT_EQ(read_file("server.py"), source_);
}

TEST_F(IntegrationTest, SecondRunGetsNextVersion)
{
    write_file("server.py", source_);
    write_file("patch.json", R"({"hunks": [{"search_block": "pass", "replace_block": "return"}]})");

    ASSERT_EQ(run(batch_config()), exit_success);
    ASSERT_EQ(run(batch_config()), exit_success);

    EXPECT_TRUE(std::filesystem::exists(path("server_v0.0.py")));
    EXPECT_TRUE(std::filesystem::exists(path("server_v0.1.py")));
    EXPECT_THAT(output_.str(), testing::HasSubstr("Patched file saved as: " + path("server_v0.1.py")));
}

TEST_F(IntegrationTest, FencedPayloadInPlace)
{
    write_file("server.py", source_);
    write_file("patch.json", "```json\n"
                             R"({"hunks": [{"description": "rename", "search_block": "def stop(self):", "replace_block": "def shutdown(self):"}]})"
                             "\n```");

    auto config = batch_config();
    config.in_place = true;

    EXPECT_EQ(run(config), exit_success);
    EXPECT_THAT(read_file("server.py"), testing::HasSubstr("\tdef shutdown(self):\r\n"));
    EXPECT_FALSE(std::filesystem::exists(path("server_v0.0.py")));
}

TEST_F(IntegrationTest, InvalidPayloadLeavesFilesAlone)
{
    write_file("server.py", source_);
    write_file("patch.json", R"({"hunks": [{"search_block": "pass"}]})");

    EXPECT_EQ(run(batch_config()), exit_error);
    EXPECT_THAT(errors_.str(), testing::HasSubstr("Hunk 1 is missing replace_block."));
    EXPECT_EQ(read_file("server.py"), source_);
    EXPECT_FALSE(std::filesystem::exists(path("server_v0.0.py")));
}

TEST_F(IntegrationTest, SavesPatchLog)
{
    write_file("server.py", source_);
    write_file("patch.json", R"json({"hunks": [
        {"description": "missing", "search_block": "nowhere()", "replace_block": "x"},
        {"description": "close", "search_block": "pass", "replace_block": "self.close()"}
    ]})json");

    auto config = batch_config();
    config.log_dir = path("logs");

    EXPECT_EQ(run(config), exit_hunks_failed);

    std::vector<std::filesystem::path> logs;
    for (const auto& entry : std::filesystem::directory_iterator(path("logs"))) {
        logs.push_back(entry.path());
    }
    ASSERT_EQ(logs.size(), 1);
    EXPECT_THAT(logs[0].filename().string(), testing::StartsWith("sturdypatch_log_"));

    auto log = read_file("logs/" + logs[0].filename().string());
    EXPECT_THAT(log, testing::HasSubstr("Hunk 1: missing\nHunk 1 not found in file.\n"));
    EXPECT_THAT(log, testing::HasSubstr("Hunk 2: close\nStrict match at line 7\n"));
}

} // namespace sturdypatch
