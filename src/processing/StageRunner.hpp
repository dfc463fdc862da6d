#pragma once

#include "../model/DocumentTypes.hpp"
#include "Diagnostics.hpp"
#include "PreprocessorErrors.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <plog/Log.h>

namespace docstruct {

// Runs one stage (callable returning T), measures its duration and logs the outcome.
// Failures propagate: PreprocessorErrors as thrown, anything else wrapped in StageError.
template<typename T, typename StageError, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = steady_clock::now();
    auto elapsed = [&start]() { return duration_cast<microseconds>(steady_clock::now() - start); };

    try
    {
        StageResult<T> sr;
        sr.result = fn();
        sr.duration = elapsed();
        sr.stage_name = stage_name;
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << sr.duration.count() << "us";
        }
        return sr;
    }
    catch (const PreprocessorError& ex)
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << elapsed().count() << "us: " << ex.what();
        throw;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << elapsed().count() << "us: " << ex.what();
        throw StageError(stage_name + ": " + ex.what());
    }
}

} // namespace docstruct
