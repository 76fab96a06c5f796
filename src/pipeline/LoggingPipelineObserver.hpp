#pragma once

#include "IPipelineObserver.hpp"

#include <atomic>
#include <cstdint>

namespace pipeline
{

struct PipelineCounters
{
    std::uint64_t validated = 0;
    std::uint64_t rejected = 0;
    std::uint64_t extraction_failures = 0;
    std::uint64_t anonymized = 0;
    std::uint64_t fallbacks = 0;
    std::uint64_t skipped = 0;
    std::uint64_t responded = 0;
};

// Writes one trace line per lifecycle event to the pipeline logger and keeps
// running counters. Document text is only logged as a Diagnostics preview.
class LoggingPipelineObserver : public IPipelineObserver
{
public:
    void onValidated(const RequestContext& ctx) override;
    void onRejected(const RequestContext& ctx, ErrorKind kind, const std::string& reason) override;
    void onTempWritten(const RequestContext& ctx, const std::filesystem::path& path) override;
    void onExtracted(const RequestContext& ctx, const std::string& raw_text,
                     std::chrono::microseconds duration) override;
    void onExtractionFailed(const RequestContext& ctx, const std::string& reason) override;
    void onAnonymized(const RequestContext& ctx, const AnonymizationResult& result,
                      std::chrono::microseconds duration) override;
    void onTempReleased(const RequestContext& ctx, const std::filesystem::path& path) override;
    void onResponded(const RequestContext& ctx, int http_status) override;

    [[nodiscard]] PipelineCounters counters() const;

private:
    std::atomic<std::uint64_t> validated_{ 0 };
    std::atomic<std::uint64_t> rejected_{ 0 };
    std::atomic<std::uint64_t> extraction_failures_{ 0 };
    std::atomic<std::uint64_t> anonymized_{ 0 };
    std::atomic<std::uint64_t> fallbacks_{ 0 };
    std::atomic<std::uint64_t> skipped_{ 0 };
    std::atomic<std::uint64_t> responded_{ 0 };
};

} // namespace pipeline
