#pragma once

#include "IProcessInvoker.hpp"

#include <string>

namespace pipeline
{

// Mandatory stage: turns a materialised document into raw text.
// One invocation per request, no retry. Any failure throws ExtractionError.
class ExtractionStage
{
public:
    ExtractionStage(IProcessInvoker& invoker, WorkerCommand worker);

    [[nodiscard]] std::string extract(const std::string& path);

private:
    IProcessInvoker& invoker_;
    WorkerCommand worker_;
};

} // namespace pipeline
