#pragma once

#include "IProcessInvoker.hpp"

namespace pipeline
{

// fork/execvp based invoker. Blocks the calling thread until the worker exits
// or the deadline passes; safe to use from many request threads at once.
class PosixProcessInvoker : public IProcessInvoker
{
public:
    PosixProcessInvoker();

    WorkerOutcome run(const WorkerInvocation& invocation,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;
};

} // namespace pipeline
