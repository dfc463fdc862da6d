#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"
#include "Profile.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
LoggingSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

constexpr std::int64_t kMaxSeverity = static_cast<std::int64_t>(plog::verbose);

void reportBadValue(const char* key, const std::string& value)
{
    ErrorReporter::ReportWarning(ErrorCategory::Configuration, std::string("logging.") + key + " ignored", value);
}

} // namespace

LoggingSettings LogManager::LoadSettings(const std::string& config_path)
{
    LoggingSettings settings;

    std::error_code ec;
    if (config_path.empty() || !std::filesystem::exists(config_path, ec))
        return settings;

    toml::table root;
    try
    {
        root = toml::parse_file(config_path);
    }
    catch (const toml::parse_error& ex)
    {
        // The engine config loader rejects the same file; only the log setup falls back here
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging settings ignored",
                                     std::string(ex.description()));
        return settings;
    }

    const toml::table* logging = root["logging"].as_table();
    if (!logging)
        return settings;

    if (auto level = (*logging)["level"].value<std::int64_t>())
    {
        if (*level >= 0 && *level <= kMaxSeverity)
            settings.level = static_cast<plog::Severity>(*level);
        else
            reportBadValue("level", std::to_string(*level) + " (expected 0-6)");
    }

    settings.append = (*logging)["append"].value_or(settings.append);

    if (auto file = (*logging)["file"].value<std::string>(); file && !file->empty())
        settings.file = *file;

    if (auto size_mb = (*logging)["max_file_size_mb"].value<std::int64_t>())
    {
        if (*size_mb > 0)
            settings.max_file_size = static_cast<std::size_t>(*size_mb) * 1024 * 1024;
        else
            reportBadValue("max_file_size_mb", std::to_string(*size_mb));
    }

    if (auto backups = (*logging)["backup_count"].value<std::int64_t>())
    {
        if (*backups >= 0)
            settings.backup_count = static_cast<std::size_t>(*backups);
        else
            reportBadValue("backup_count", std::to_string(*backups));
    }

    return settings;
}

bool LogManager::Initialize(const LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    s_initialized = PrepareLogDirectory();
    return s_initialized;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before LogManager::Initialize",
                                   config.name);
        return false;
    }

    try
    {
        if (!config.append_override.value_or(s_settings.append))
            std::ofstream(config.filepath, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), s_settings.max_file_size, static_cast<int>(s_settings.backup_count));
        auto& logger = plog::init<InstanceId>(config.level_override.value_or(s_settings.level), file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log '" + config.name + "'",
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<docstruct::Diagnostics::kLogInstance>(const LoggerConfig&);

#if DOCSTRUCT_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

const LoggingSettings& LogManager::GetSettings() { return s_settings; }

std::string LogManager::SiblingLogPath(const std::string& file_name)
{
    return (std::filesystem::path(s_settings.file).parent_path() / file_name).string();
}

bool LogManager::PrepareLogDirectory()
{
    const std::filesystem::path dir = std::filesystem::path(s_settings.file).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to create log directory " + dir.string(),
                                   ec.message());
        return false;
    }
    return true;
}

} // namespace utils
