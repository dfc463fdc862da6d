#include "Application.hpp"
#include "config/ConfigLoader.hpp"
#include "config/EngineConfig.hpp"
#include "processing/Diagnostics.hpp"
#include "processing/DocumentEngine.hpp"
#include "processing/PreprocessorErrors.hpp"
#include "serialization/JsonSerialization.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string_view>
#include <utility>
#include <vector>

#include <plog/Log.h>

namespace
{

constexpr const char* kDefaultConfigPath = "docstruct.toml";

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << "docstruct: " << usage_error_ << "\n\n";
        printUsage(std::cerr);
        return kExitUsage;
    }

    if (options_.show_help)
    {
        printUsage(std::cout);
        return kExitSuccess;
    }

    if (!initializeLogging())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                            "Logging unavailable, continuing without log files");
    }

    docstruct::Diagnostics::SetVerbose(options_.verbose);

    int code = process();
    PLOG_INFO << "Finished with exit code " << code << ", "
              << utils::ErrorReporter::CountAtLeast(utils::ErrorSeverity::Warning) << " problem(s) reported";
    printPendingErrors();
    return code;
}

bool Application::parseCommandLineArgs()
{
    for (int i = 1; i < argc_; ++i)
    {
        std::string_view arg = argv_[i];

        auto next_value = [&](std::string& target) {
            if (i + 1 >= argc_)
            {
                usage_error_ = std::string(arg) + " requires a value";
                return false;
            }
            target = argv_[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            options_.show_help = true;
            return true;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (!next_value(options_.config_path))
                return false;
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (!next_value(options_.output_path))
                return false;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options_.verbose = true;
        }
        else if (arg == "--no-group")
        {
            options_.no_group = true;
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            usage_error_ = "unknown option " + std::string(arg);
            return false;
        }
        else if (options_.input_path.empty())
        {
            options_.input_path = std::string(arg);
        }
        else
        {
            usage_error_ = "unexpected argument " + std::string(arg);
            return false;
        }
    }

    if (options_.input_path.empty())
    {
        usage_error_ = "missing span document";
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    const std::string config_path = options_.config_path.empty() ? kDefaultConfigPath : options_.config_path;
    if (!utils::LogManager::Initialize(utils::LogManager::LoadSettings(config_path)))
        return false;

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = utils::LogManager::GetSettings().file,
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .add_console_appender = options_.verbose });

    ok = utils::LogManager::RegisterLogger<docstruct::Diagnostics::kLogInstance>(
             { .name = "diagnostics",
               .filepath = utils::LogManager::SiblingLogPath("diagnostics.log"),
               .append_override = std::nullopt,
               .level_override = plog::info,
               .add_console_appender = false }) &&
         ok;

#if DOCSTRUCT_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>(
        { .name = "profiling",
          .filepath = utils::LogManager::SiblingLogPath("profiling.log"),
          .append_override = std::nullopt,
          .level_override = plog::debug,
          .add_console_appender = false });
#endif

    return ok;
}

int Application::process()
{
    PROFILE_SCOPE_FUNCTION();

    docstruct::EngineConfig config;
    try
    {
        // An explicit --config must exist; the implicit default file is optional
        if (!options_.config_path.empty() && !std::filesystem::exists(options_.config_path))
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Config file not found",
                                              options_.config_path);
            return kExitInputError;
        }
        config = docstruct::loadEngineConfig(options_.config_path.empty() ? kDefaultConfigPath : options_.config_path);
    }
    catch (const docstruct::ConfigError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration", ex.what());
        return kExitInputError;
    }

    if (options_.no_group)
        config.group_by_function = false;

    std::vector<docstruct::Page> pages;
    try
    {
        pages = docstruct::loadPages(options_.input_path);
    }
    catch (const docstruct::InvalidContentError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Cannot read span document", ex.what());
        return kExitInputError;
    }

    try
    {
        docstruct::DocumentEngine engine(std::move(config));
        docstruct::PreprocessResult result = engine.process(pages);

        for (const auto& warning : result.diagnostics.warnings)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Processing, warning);
        }

        if (!writeResult(result))
            return kExitProcessingError;
    }
    catch (const docstruct::ConfigError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Invalid configuration", ex.what());
        return kExitInputError;
    }
    catch (const docstruct::InvalidContentError& ex)
    {
        utils::ErrorReporter::ReportException(utils::ErrorCategory::Input, "Span document has no usable content", ex);
        return kExitInputError;
    }
    catch (const docstruct::PreprocessorError& ex)
    {
        utils::ErrorReporter::ReportException(utils::ErrorCategory::Processing, "Preprocessing failed", ex);
        return kExitProcessingError;
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Unexpected failure", ex.what());
        return kExitProcessingError;
    }

    return kExitSuccess;
}

bool Application::writeResult(const docstruct::PreprocessResult& result)
{
    const std::string text = docstruct::toJson(result).dump(2);

    if (options_.output_path.empty())
    {
        std::cout << text << '\n';
        return true;
    }

    std::ofstream out(options_.output_path, std::ios::trunc);
    if (!out)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Output, "Cannot write result", options_.output_path);
        return false;
    }
    out << text << '\n';
    PLOG_INFO << "Wrote result to " << options_.output_path;
    return true;
}

void Application::printUsage(std::ostream& out) const
{
    out << "Usage: docstruct <spans.json> [options]\n"
           "\n"
           "Options:\n"
           "  -c, --config <file>   TOML configuration (default: " << kDefaultConfigPath << " if present)\n"
           "  -o, --output <file>   write JSON result to file instead of stdout\n"
           "  -v, --verbose         trace each stage and echo the log to stderr\n"
           "      --no-group        skip functional grouping\n"
           "  -h, --help            show this help\n";
}

void Application::printPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity == utils::ErrorSeverity::Warning && !options_.verbose)
            continue;
        std::cerr << utils::ErrorReporter::Format(report) << '\n';
    }
}
