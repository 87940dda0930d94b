#include "evalbox/common/exceptions.hpp"
#include "evalbox/common/io_utils.hpp"
#include "evalbox/config.hpp"
#include "evalbox/sandbox/language.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace evalbox;
using namespace nlohmann;

class LanguageTest : public ::testing::Test {
protected:
    language_registry registry;
};

TEST_F(LanguageTest, BuiltinTest) {
    EXPECT_TRUE(registry.contains("python"));
    EXPECT_TRUE(registry.contains("python3"));
    EXPECT_TRUE(registry.contains("Bash"));
    EXPECT_TRUE(registry.contains("sh"));
    EXPECT_FALSE(registry.contains("ruby"));

    auto &python = registry.find("PYTHON3");
    EXPECT_EQ(python.name, "python");
    EXPECT_EQ(python.source_file, "main.py");
    ASSERT_EQ(python.error_signatures.size(), 1u);
    EXPECT_EQ(python.error_signatures[0], "Traceback (most recent call last)");
    EXPECT_TRUE(python.limit_address_space);

    EXPECT_THROW(registry.find("ruby"), invalid_input_error);
}

TEST_F(LanguageTest, BuildCommandTest) {
    vector<string> expected = {"python3", "/tmp/run-1/main.py"};
    EXPECT_EQ(registry.find("python").build_command("/tmp/run-1/main.py"), expected);
}

TEST_F(LanguageTest, LoadTest) {
    json config = json::parse(R"json({
        "languages": {
            "ruby": {
                "source_file": "main.rb",
                "command": ["ruby", "--disable-gems", "{source}"],
                "error_signatures": ["(RuntimeError)"],
                "aliases": ["rb"]
            },
            "python": {
                "source_file": "solution.py",
                "command": ["python3", "-S", "{source}"],
                "limit_address_space": false
            }
        }
    })json");
    registry.load(config);

    auto &ruby = registry.find("rb");
    EXPECT_EQ(ruby.name, "ruby");
    EXPECT_EQ(ruby.command.size(), 3u);
    EXPECT_TRUE(ruby.limit_address_space);

    auto &python = registry.find("python");
    EXPECT_EQ(python.source_file, "solution.py");
    EXPECT_FALSE(python.limit_address_space);
    EXPECT_TRUE(python.error_signatures.empty());
    // 覆盖后别名仍然有效
    EXPECT_EQ(registry.find("python3").source_file, "solution.py");
}

TEST_F(LanguageTest, LoadFileTest) {
    temporary_directory dir(RUN_DIR, "lang-");
    write_file_content(dir.path() / "languages.json", R"({"languages": {"dash": {"source_file": "main.sh", "command": ["dash", "{source}"]}}})");
    registry.load(dir.path() / "languages.json");
    EXPECT_TRUE(registry.contains("dash"));

    write_file_content(dir.path() / "broken.json", "{\"languages\": ");
    EXPECT_THROW(registry.load(dir.path() / "broken.json"), invalid_input_error);
    EXPECT_THROW(registry.load(dir.path() / "missing.json"), invalid_input_error);
}

TEST_F(LanguageTest, InvalidLanguageTest) {
    EXPECT_THROW(registry.load(json::parse(R"({"languages": {"x": {"source_file": "../escape.py", "command": ["python3"]}}})")), invalid_input_error);
    EXPECT_THROW(registry.load(json::parse(R"({"languages": {"x": {"source_file": "/etc/passwd", "command": ["python3"]}}})")), invalid_input_error);
    EXPECT_THROW(registry.load(json::parse(R"({"languages": {"x": {"source_file": "main.x", "command": []}}})")), invalid_input_error);
    EXPECT_THROW(registry.load(json::parse(R"({"languages": {"x": {"command": ["x"]}}})")), invalid_input_error);
    EXPECT_THROW(registry.load(json::parse(R"({"languages": []})")), invalid_input_error);
    EXPECT_FALSE(registry.contains("x"));
}
