#pragma once

#include "AnonymizationStage.hpp"
#include "PipelineTypes.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace pipeline
{

struct RequestContext
{
    std::uint64_t request_id = 0;
    std::string filename;
    std::uint64_t size_bytes = 0;
};

// Lifecycle events emitted by RequestOrchestrator. Callbacks run on the
// request thread and must not throw.
class IPipelineObserver
{
public:
    virtual ~IPipelineObserver() = default;

    virtual void onValidated(const RequestContext& ctx) = 0;
    virtual void onRejected(const RequestContext& ctx, ErrorKind kind, const std::string& reason) = 0;
    virtual void onTempWritten(const RequestContext& ctx, const std::filesystem::path& path) = 0;
    virtual void onExtracted(const RequestContext& ctx, const std::string& raw_text,
                             std::chrono::microseconds duration) = 0;
    virtual void onExtractionFailed(const RequestContext& ctx, const std::string& reason) = 0;
    virtual void onAnonymized(const RequestContext& ctx, const AnonymizationResult& result,
                              std::chrono::microseconds duration) = 0;
    virtual void onTempReleased(const RequestContext& ctx, const std::filesystem::path& path) = 0;
    virtual void onResponded(const RequestContext& ctx, int http_status) = 0;
};

} // namespace pipeline
