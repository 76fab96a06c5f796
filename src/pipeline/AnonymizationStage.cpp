#include "AnonymizationStage.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace pipeline
{

const char* to_string(AnonymizationOutcome outcome) noexcept
{
    switch (outcome)
    {
    case AnonymizationOutcome::Transformed:
        return "transformed";
    case AnonymizationOutcome::FellBack:
        return "fell_back";
    case AnonymizationOutcome::Skipped:
        return "skipped";
    }
    return "unknown";
}

AnonymizationStage::AnonymizationStage(IProcessInvoker& invoker, WorkerCommand worker, PayloadMode mode,
                                       bool enabled)
    : invoker_(invoker)
    , worker_(std::move(worker))
    , mode_(mode)
    , enabled_(enabled)
{
}

AnonymizationResult AnonymizationStage::anonymize(const std::string& text)
{
    if (!enabled_)
    {
        return AnonymizationResult{ text, AnonymizationOutcome::Skipped, "anonymization disabled" };
    }

    WorkerInvocation invocation;
    invocation.command = worker_.command;
    invocation.args = worker_.args;
    if (mode_ == PayloadMode::Argument)
        invocation.args.push_back(text);
    else
        invocation.stdin_payload = text;

    WorkerOutcome outcome = invoker_.run(invocation, worker_.timeout);

    if (!outcome.spawned())
        return fallBack(text, "worker failed to start", *outcome.spawn_error);

    if (outcome.timed_out)
        return fallBack(text, "worker timed out", "killed after " + std::to_string(outcome.elapsed.count()) + "ms");

    if (outcome.exit_code != 0)
    {
        return fallBack(text, "worker exited with code " + std::to_string(outcome.exit_code),
                        trim_whitespace(outcome.stderr_data));
    }

    // Empty output for non-empty input would hand the caller nothing
    if (outcome.stdout_data.empty() && !trim_whitespace(text).empty())
        return fallBack(text, "worker produced no output", trim_whitespace(outcome.stderr_data));

    if (Diagnostics::IsVerbose() && !outcome.stderr_data.empty())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Anonymization] worker stderr="
                                               << Diagnostics::Preview(outcome.stderr_data);
    }

    return AnonymizationResult{ sanitize_utf8(outcome.stdout_data), AnonymizationOutcome::Transformed, {} };
}

AnonymizationResult AnonymizationStage::fallBack(const std::string& text, std::string reason, const std::string& details)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Anonymization,
                                        "Anonymization failed, returning raw text (" + reason + ")", details);
    return AnonymizationResult{ text, AnonymizationOutcome::FellBack, std::move(reason) };
}

} // namespace pipeline
