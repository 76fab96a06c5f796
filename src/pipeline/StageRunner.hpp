#pragma once

#include "PipelineTypes.hpp"
#include "PipelineErrors.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/ErrorReporter.hpp"

namespace pipeline {

// Utility to run a stage (callable returning T) and produce StageResult<T>.
// Measures duration, classifies the failure and reports it under `category`.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, utils::ErrorCategory category, Fn&& fn)
{
    using namespace std::chrono;
    auto start = steady_clock::now();
    auto elapsed = [&start]() { return duration_cast<microseconds>(steady_clock::now() - start); };

    try
    {
        T res = fn();
        auto dur = elapsed();
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const PipelineError& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed (" << to_string(ex.kind())
                                               << ") in " << dur.count() << "us: " << ex.what();
        std::string details = stage_name + ": " + ex.what();
        if (!ex.details().empty())
            details += " | " + ex.details();
        utils::ErrorReporter::ReportError(category, "Pipeline stage failed", details);
        return StageResult<T>::failure(ex.kind(), ex.what(), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportError(category, "Pipeline stage failed unexpectedly", stage_name + ": " + ex.what());
        return StageResult<T>::failure(ErrorKind::Unexpected, ex.what(), dur, stage_name);
    }
    catch (...)
    {
        auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed with unknown exception in " << dur.count() << "us";
        utils::ErrorReporter::ReportError(category, "Pipeline stage failed unexpectedly", stage_name + ": unknown exception");
        return StageResult<T>::failure(ErrorKind::Unexpected, "unknown exception", dur, stage_name);
    }
}

} // namespace pipeline
