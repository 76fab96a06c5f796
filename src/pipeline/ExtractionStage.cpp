#include "ExtractionStage.hpp"
#include "PipelineErrors.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>

namespace pipeline
{

ExtractionStage::ExtractionStage(IProcessInvoker& invoker, WorkerCommand worker)
    : invoker_(invoker)
    , worker_(std::move(worker))
{
}

std::string ExtractionStage::extract(const std::string& path)
{
    WorkerInvocation invocation;
    invocation.command = worker_.command;
    invocation.args = worker_.args;
    invocation.args.push_back(path);

    WorkerOutcome outcome = invoker_.run(invocation, worker_.timeout);

    if (!outcome.spawned())
    {
        throw ExtractionError(ExtractionError::Cause::Spawn, "extraction worker failed to start",
                              *outcome.spawn_error);
    }

    if (outcome.timed_out)
    {
        throw ExtractionError(ExtractionError::Cause::Timeout,
                              "extraction worker killed after " + std::to_string(outcome.elapsed.count()) + "ms",
                              trim_whitespace(outcome.stderr_data));
    }

    if (outcome.exit_code != 0)
    {
        throw ExtractionError(ExtractionError::Cause::Execution,
                              "extraction worker exited with code " + std::to_string(outcome.exit_code),
                              trim_whitespace(outcome.stderr_data));
    }

    PLOG_DEBUG << "Extraction produced " << outcome.stdout_data.size() << " bytes in " << outcome.elapsed.count()
               << "ms";
    return sanitize_utf8(outcome.stdout_data);
}

} // namespace pipeline
