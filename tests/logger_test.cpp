#include "test_utils.hpp"
#include "multibar/common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using multibar::common::Config;
using multibar::common::LogFormat;
using multibar::common::Logger;
using multibar::common::LogLevel;
using multibar::common::LogMode;

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}

TEST(Logger, silent_until_initialized){
    EXPECT_NO_THROW(Logger::instance().info("[Test] Ignored | value={}", 1));
}

TEST(Logger, file_mode_writes_text_lines){
    auto dir = std::filesystem::temp_directory_path() / ("multibar_logger_test_" + std::to_string(getpid()));
    auto file = dir / "multibar.log";

    auto logging = Config::createDefaultConfig().logging;
    Logger::instance().initialize(LogMode::FILE_ONLY, file.string(), LogLevel::INFO, logging);
    Logger::instance().info("[Test] Written | id={}", 7);
    Logger::instance().debug("[Test] Filtered | id={}", 8);
    Logger::instance().shutdown();

    auto content = readFile(file);
    EXPECT_THAT(content, ::testing::HasSubstr("[info] "));
    EXPECT_THAT(content, ::testing::HasSubstr("[Test] Written | id=7"));
    EXPECT_THAT(content, ::testing::Not(::testing::HasSubstr("Filtered")));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

TEST(Logger, json_format_gets_suffixed_file){
    auto dir = std::filesystem::temp_directory_path() / ("multibar_logger_json_" + std::to_string(getpid()));
    auto file = dir / "multibar.log";

    auto logging = Config::createDefaultConfig().logging;
    logging.format = LogFormat::JSON;
    Logger::instance().initialize(LogMode::FILE_ONLY, file.string(), LogLevel::WARN, logging);
    Logger::instance().warn("[Test] Structured");
    Logger::instance().shutdown();

    auto content = readFile(dir / "multibar.json.log");
    EXPECT_THAT(content, ::testing::HasSubstr("\"level\":\"warning\""));
    EXPECT_THAT(content, ::testing::HasSubstr("\"message\":\"[Test] Structured\""));

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}
