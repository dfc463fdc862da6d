#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace utils;

namespace
{

namespace fs = std::filesystem;

fs::path writeConfig(const fs::path& dir, const std::string& text)
{
    fs::create_directories(dir);
    const fs::path file = dir / "docstruct.toml";
    std::ofstream out(file, std::ios::trunc);
    out << text;
    return file;
}

} // namespace

TEST_CASE("LogManager - settings default without a config file", "[logging]")
{
    LoggingSettings settings = LogManager::LoadSettings("");
    REQUIRE(settings.level == plog::info);
    REQUIRE(settings.append);
    REQUIRE(settings.file == "logs/docstruct.log");

    settings = LogManager::LoadSettings((fs::temp_directory_path() / "docstruct_missing.toml").string());
    REQUIRE(settings.backup_count == 3);
}

TEST_CASE("LogManager - reads the logging table", "[logging]")
{
    const fs::path dir = fs::temp_directory_path() / "docstruct_log_test";
    const fs::path file = writeConfig(dir, "[preprocessor]\nnormalize_text = true\n\n"
                                           "[logging]\nlevel = 5\nappend = false\nfile = \"out/run.log\"\n"
                                           "max_file_size_mb = 2\nbackup_count = 0\n");

    LoggingSettings settings = LogManager::LoadSettings(file.string());
    REQUIRE(settings.level == plog::debug);
    REQUIRE_FALSE(settings.append);
    REQUIRE(settings.file == "out/run.log");
    REQUIRE(settings.max_file_size == 2 * 1024 * 1024);
    REQUIRE(settings.backup_count == 0);

    std::error_code ec;
    fs::remove_all(dir, ec);
}

TEST_CASE("LogManager - bad values keep defaults and are reported", "[logging]")
{
    ErrorReporter::ClearErrors();
    const fs::path dir = fs::temp_directory_path() / "docstruct_log_bad_test";

    SECTION("Out of range level")
    {
        const fs::path file = writeConfig(dir, "[logging]\nlevel = 9\nbackup_count = -1\n");
        LoggingSettings settings = LogManager::LoadSettings(file.string());
        REQUIRE(settings.level == plog::info);
        REQUIRE(settings.backup_count == 3);
        REQUIRE(ErrorReporter::CountAtLeast(ErrorSeverity::Warning) == 2);
    }

    SECTION("Unparsable file")
    {
        const fs::path file = writeConfig(dir, "[logging\nlevel = ");
        LoggingSettings settings = LogManager::LoadSettings(file.string());
        REQUIRE(settings.file == "logs/docstruct.log");
        REQUIRE(ErrorReporter::GetLastError().category == ErrorCategory::Configuration);
    }

    ErrorReporter::ClearErrors();
    std::error_code ec;
    fs::remove_all(dir, ec);
}
