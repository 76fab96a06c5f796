#pragma once

#include "PipelineTypes.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pipeline
{

// How a stage launches its worker
struct WorkerCommand
{
    std::string command;
    std::vector<std::string> args;                      // Fixed arguments placed before the payload
    std::optional<std::chrono::milliseconds> timeout;   // Empty: wait for the worker indefinitely
};

// Runs an external worker to completion and collects its outcome.
// Implementations never throw for worker failures: spawn problems land in
// WorkerOutcome::spawn_error, non-zero exits in exit_code/stderr_data.
class IProcessInvoker
{
public:
    virtual ~IProcessInvoker() = default;

    // No timeout when `timeout` is empty
    virtual WorkerOutcome run(const WorkerInvocation& invocation,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt) = 0;
};

} // namespace pipeline
