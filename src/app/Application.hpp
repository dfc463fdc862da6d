#pragma once

#include <iosfwd>
#include <memory>
#include <string>

namespace docstruct
{
struct EngineConfig;
struct PreprocessResult;
}

// Command line front end: span dump in, structured JSON out.
class Application
{
public:
    enum ExitCode
    {
        kExitSuccess = 0,
        kExitUsage = 1,
        kExitInputError = 2,
        kExitProcessingError = 3,
    };

    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    struct Options
    {
        std::string input_path;
        std::string config_path;
        std::string output_path;
        bool verbose = false;
        bool no_group = false;
        bool show_help = false;
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    int process();

    bool writeResult(const docstruct::PreprocessResult& result);
    void printUsage(std::ostream& out) const;
    void printPendingErrors() const;

    Options options_;
    std::string usage_error_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
