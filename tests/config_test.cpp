#include <gtest/gtest.h>
#include "nestbar/common/config.hpp"
#include "nestbar/common/paths.hpp"
#include "nestbar/config/validator.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace nestbar;
using nestbar::common::Config;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("nestbar_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir_);
        Config::instance().reset();
    }

    void TearDown() override {
        unsetenv("NESTBAR_CONFIG");
        Config::instance().reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

}

TEST_F(ConfigTest, DefaultsMatchDisplayDefaults) {
    auto config = Config::createDefaultConfig();
    EXPECT_EQ(config.log_level, common::LogLevel::WARN);
    EXPECT_TRUE(config.log_file.empty());

    auto options = Config::instance().displayDefaults();
    EXPECT_DOUBLE_EQ(options.update_interval, 0.05);
    EXPECT_EQ(options.fill_char, "\xE2\x96\x88");
    EXPECT_FALSE(options.ncols.has_value());
    EXPECT_FALSE(options.text_color.has_value());
    EXPECT_FALSE(options.rainbow);
    EXPECT_TRUE(options.fields.counter);
    EXPECT_TRUE(options.fields.timer);
    EXPECT_TRUE(options.fields.rate);
    EXPECT_FALSE(options.fields.avg_rate);
    EXPECT_TRUE(options.leave);
    EXPECT_FALSE(options.disable);
}

TEST_F(ConfigTest, LoadsTomlSections) {
    std::string path = writeFile("config.toml",
        "[global]\n"
        "log_level = \"debug\"\n"
        "\n"
        "[logging]\n"
        "max_files = 5\n"
        "format = \"json\"\n"
        "\n"
        "[display]\n"
        "update_interval = 0.2\n"
        "text_color = \"green\"\n"
        "ncols = 40\n"
        "avg_rate = true\n"
        "leave = false\n");

    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.currentConfigPath(), path);
    EXPECT_EQ(config.global().log_level, common::LogLevel::DEBUG);
    EXPECT_EQ(config.global().logging.max_files, 5u);
    EXPECT_EQ(config.global().logging.format, common::LogFormat::JSON);

    auto options = config.displayDefaults();
    EXPECT_DOUBLE_EQ(options.update_interval, 0.2);
    EXPECT_EQ(options.text_color, std::optional<std::string>("green"));
    EXPECT_EQ(options.ncols, std::optional<int>(40));
    EXPECT_TRUE(options.fields.avg_rate);
    EXPECT_FALSE(options.leave);

    EXPECT_EQ(config.getValue("display.update_interval"), std::optional<std::string>("0.200"));
    EXPECT_EQ(config.getValue("display.ncols"), std::optional<std::string>("40"));
    EXPECT_EQ(config.getValue("log_level"), std::optional<std::string>("DEBUG"));
    EXPECT_FALSE(config.getValue("display.unknown").has_value());
}

TEST_F(ConfigTest, IntegerIntervalAccepted) {
    std::string path = writeFile("int.toml", "[display]\nupdate_interval = 1\n");
    ASSERT_TRUE(Config::instance().load(path));
    EXPECT_DOUBLE_EQ(Config::instance().displayDefaults().update_interval, 1.0);
}

TEST_F(ConfigTest, MalformedFileKeepsDefaults) {
    std::string path = writeFile("broken.toml", "[display\nupdate_interval = \n");

    auto& config = Config::instance();
    EXPECT_FALSE(config.load(path));
    EXPECT_TRUE(config.currentConfigPath().empty());
    EXPECT_DOUBLE_EQ(config.displayDefaults().update_interval, 0.05);
}

TEST_F(ConfigTest, MissingExplicitFileFails) {
    EXPECT_FALSE(Config::instance().load((dir_ / "absent.toml").string()));
}

TEST_F(ConfigTest, EnvironmentOverridesSearchPath) {
    std::string path = writeFile("env.toml", "[display]\nrainbow = true\n");
    setenv("NESTBAR_CONFIG", path.c_str(), 1);

    auto paths = common::PathManager::instance().getConfigSearchPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), path);

    auto& config = Config::instance();
    EXPECT_EQ(config.findBestConfig(), std::optional<std::string>(path));
    ASSERT_TRUE(config.load());
    EXPECT_TRUE(config.displayDefaults().rainbow);
}

TEST_F(ConfigTest, ValidateFileReportsBadValues) {
    std::string path = writeFile("bad.toml",
        "[display]\n"
        "update_interval = -1.0\n"
        "fill_char = \"##\"\n");

    auto result = config::ConfigValidator().validateFile(path);
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST(LogLevelTest, ParseAndFormat) {
    EXPECT_EQ(common::parseLogLevel("info"), common::LogLevel::INFO);
    EXPECT_EQ(common::parseLogLevel("ERROR"), common::LogLevel::ERROR);
    EXPECT_FALSE(common::parseLogLevel("verbose").has_value());
    EXPECT_EQ(common::to_string(common::LogLevel::WARN), "WARN");
}
