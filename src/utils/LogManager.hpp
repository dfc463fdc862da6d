#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] table of the configuration file
struct LoggingSettings
{
    plog::Severity level = plog::info;
    bool append = true;
    std::string file = "logs/docstruct.log";
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t backup_count = 3;
};

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        bool add_console_appender = false;
    };

    // Defaults for anything missing; out-of-range values are reported as warnings and skipped
    static LoggingSettings LoadSettings(const std::string& config_path);

    // Safe to call more than once; the first call wins
    static bool Initialize(const LoggingSettings& settings = {});

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static const LoggingSettings& GetSettings();

    // Path of an auxiliary log placed next to the main log file
    static std::string SiblingLogPath(const std::string& file_name);

private:
    LogManager() = default;

    static bool PrepareLogDirectory();

    static bool s_initialized;
    static LoggingSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
