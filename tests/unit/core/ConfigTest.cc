#include "chronicle/core/Config.hh"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace chronicle;

class ConfigTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "chronicle_config_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override { std::filesystem::remove_all(tempDir_); }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path tempDir_;
};

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& config = result.value();
    EXPECT_EQ(config.threads, 1);
    EXPECT_EQ(config.skipSaves, 0);
    EXPECT_EQ(config.maxNestingDepth, 256);
    EXPECT_EQ(config.saveDir, "saves");
    EXPECT_EQ(config.storeDir, "store");
    EXPECT_EQ(config.logLevel, "info");
    EXPECT_TRUE(config.observerName.empty());
    EXPECT_FALSE(config.readAllCountries);
}

TEST_F(ConfigTest, ReadsAllSections) {
    auto result = Config::parse(R"(
[import]
threads = 4
save_name_filter = "ironman"
skip_saves = 2
max_nesting_depth = 64
save_dir = "/games/stellaris/save games"

[timeline]
observer_name = "alice"
read_all_countries = true

[store]
dir = "/var/lib/chronicle"

[log]
level = "debug"
file = "chronicle.log"
)");
    ASSERT_TRUE(result.isOk()) << result.message();
    const auto& config = result.value();
    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.saveNameFilter, "ironman");
    EXPECT_EQ(config.skipSaves, 2);
    EXPECT_EQ(config.maxNestingDepth, 64);
    EXPECT_EQ(config.saveDir, "/games/stellaris/save games");
    EXPECT_EQ(config.observerName, "alice");
    EXPECT_TRUE(config.readAllCountries);
    EXPECT_EQ(config.storeDir, "/var/lib/chronicle");
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_EQ(config.logFile, "chronicle.log");
}

TEST_F(ConfigTest, WrongTypeIsAnError) {
    auto result = Config::parse("[import]\nthreads = \"four\"\n", "inline.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::TypeMismatch);
    EXPECT_NE(result.message().find("inline.toml"), std::string::npos);
    EXPECT_NE(result.message().find("import.threads"), std::string::npos);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    EXPECT_EQ(Config::parse("[import]\nthreads = 0\n").code(), ErrorCode::OutOfRange);
    EXPECT_EQ(Config::parse("[import]\nskip_saves = -1\n").code(), ErrorCode::OutOfRange);
    EXPECT_EQ(Config::parse("[import]\nmax_nesting_depth = 2\n").code(), ErrorCode::OutOfRange);

    auto level = Config::parse("[log]\nlevel = \"loud\"\n");
    ASSERT_TRUE(level.isError());
    EXPECT_EQ(level.code(), ErrorCode::InvalidState);
    EXPECT_NE(level.message().find("loud"), std::string::npos);
}

TEST_F(ConfigTest, SyntaxErrorReportsPosition) {
    auto result = Config::parse("[import\nthreads = 2\n", "broken.toml");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::ParseFailure);
    EXPECT_EQ(result.message().rfind("broken.toml:1:", 0), 0u);
}

TEST_F(ConfigTest, LoadFromFile) {
    auto path = writeFile("chronicle.toml", "[timeline]\nobserver_name = \"bob\"\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.isOk()) << result.message();
    EXPECT_EQ(result.value().observerName, "bob");

    auto missing = Config::load(tempDir_ / "missing.toml");
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
}

TEST_F(ConfigTest, DottedKeyLookups) {
    auto table = toml::parse("[a]\nname = \"x\"\ncount = 3\nflag = false\n[a.b]\ndeep = 1\n");

    EXPECT_EQ(getString(table, "a.name").value(), "x");
    EXPECT_EQ(getInt(table, "a.count").value(), 3);
    EXPECT_FALSE(getBool(table, "a.flag").value());
    EXPECT_EQ(getInt(table, "a.b.deep").value(), 1);

    EXPECT_EQ(getInt(table, "a.missing").code(), ErrorCode::NotFound);
    EXPECT_EQ(getInt(table, "a.name.deeper").code(), ErrorCode::NotFound);
    EXPECT_EQ(getString(table, "a.count").code(), ErrorCode::TypeMismatch);
    EXPECT_EQ(getBool(table, "a").code(), ErrorCode::TypeMismatch);
}
