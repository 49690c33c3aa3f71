#include "termbar/common/logger.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/progress/progress_bar.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

using termbar::common::LogFormat;
using termbar::common::LogLevel;
using termbar::common::LogMode;
using termbar::common::Logger;

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test
{
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("termbar_logger_test_" + std::to_string(::getpid()));
        fs::remove_all(dir_);
    }

    void TearDown() override {
        Logger::instance().shutdown();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static std::string readFile(const fs::path& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path dir_;
};

TEST_F(LoggerTest, SilentUntilInitialized)
{
    ASSERT_FALSE(Logger::instance().isInitialized());
    Logger::instance().debug("nothing {}", 1);
    Logger::instance().error("nothing {}", 2);
    Logger::instance().flush();
    EXPECT_FALSE(Logger::instance().isInitialized());
}

TEST_F(LoggerTest, FileModeCreatesDirectoryAndWrites)
{
    fs::path log_file = dir_ / "logs" / "bars.log";
    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::DEBUG,
                                  termbar::common::defaultLoggingConfig());
    ASSERT_TRUE(Logger::instance().isInitialized());

    Logger::instance().info("rendered {} frames", 12);
    Logger::instance().flush();

    std::string contents = readFile(log_file);
    EXPECT_NE(std::string::npos, contents.find("rendered 12 frames"));
    EXPECT_NE(std::string::npos, contents.find("[info]"));
    EXPECT_NE(std::string::npos, contents.find(termbar::constants::version::getFullVersion()));
    EXPECT_NE(std::string::npos, contents.find("termbar v1.0.0 logging at debug"));
}

TEST_F(LoggerTest, JsonFormatUsesSuffixedFile)
{
    fs::path log_file = dir_ / "bars.log";
    termbar::common::LoggingConfig config = termbar::common::defaultLoggingConfig();
    config.format = LogFormat::JSON;

    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::INFO, config);
    Logger::instance().warn("slow terminal");
    Logger::instance().flush();

    std::string contents = readFile(dir_ / "bars.json.log");
    EXPECT_NE(std::string::npos, contents.find("\"level\":\"warning\""));
    EXPECT_NE(std::string::npos, contents.find("\"message\":\"slow terminal\""));
}

TEST_F(LoggerTest, LevelFiltersMessages)
{
    fs::path log_file = dir_ / "bars.log";
    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::WARN,
                                  termbar::common::defaultLoggingConfig());

    Logger::instance().debug("hidden detail");
    Logger::instance().error("visible failure");
    Logger::instance().flush();

    std::string contents = readFile(log_file);
    EXPECT_EQ(std::string::npos, contents.find("hidden detail"));
    EXPECT_NE(std::string::npos, contents.find("visible failure"));
}

TEST_F(LoggerTest, BarDiagnosticsStayOffTheOutputStream)
{
    fs::path log_file = dir_ / "bars.log";
    Logger::instance().initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::DEBUG,
                                  termbar::common::defaultLoggingConfig());

    std::ostringstream out;
    termbar::progress::BarOptions opts;
    opts.out = &out;
    opts.style = static_cast<termbar::progress::BarStyle>(42);
    termbar::progress::ProgressBar bar("logged", 10, 0, 10, opts);
    bar.advance(10);
    bar.render();
    Logger::instance().flush();

    std::string contents = readFile(log_file);
    EXPECT_NE(std::string::npos, contents.find("drawn with default glyphs"));
    EXPECT_NE(std::string::npos, contents.find("finished at 10"));
    EXPECT_EQ(std::string::npos, out.str().find("[ProgressBar]"));
}

TEST(LogLevelConfig, ParsesNames)
{
    EXPECT_EQ(LogLevel::DEBUG, termbar::common::parseLogLevel("DEBUG"));
    EXPECT_EQ(LogLevel::WARN, termbar::common::parseLogLevel("warning"));
    EXPECT_FALSE(termbar::common::parseLogLevel("verbose").has_value());
    EXPECT_EQ("error", termbar::common::logLevelToString(LogLevel::ERROR));
}

TEST(LogLevelConfig, Defaults)
{
    termbar::common::LoggingConfig config = termbar::common::defaultLoggingConfig();
    EXPECT_EQ(10u, config.rotation_size_mb);
    EXPECT_EQ(3u, config.max_files);
    EXPECT_EQ(LogFormat::TEXT, config.format);
}
