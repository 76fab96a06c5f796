#pragma once

#include "AnonymizationStage.hpp"
#include "ExtractionStage.hpp"
#include "IPipelineObserver.hpp"
#include "PipelineTypes.hpp"
#include "TempFileManager.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace pipeline
{

struct UploadLimits
{
    std::uint64_t max_bytes = 5ull * 1024 * 1024;
    std::string accepted_mime_type = "application/pdf";
};

// Caller-visible messages. Internal diagnostics never reach the response.
namespace messages
{
inline constexpr const char* kNoFile = "No file provided";
inline constexpr const char* kInvalidType = "Invalid file type. Only PDF files are allowed.";
inline constexpr const char* kProcessingFailed = "Error processing file. Please try again.";
std::string fileTooLarge(std::uint64_t max_bytes);
} // namespace messages

// Drives one upload through validate -> temp write -> extract -> anonymize -> respond.
//
// Every path that acquires a temp file releases it exactly once (ScopedTempFile),
// including when a stage throws something unexpected. process() never throws;
// failures come back as a PipelineResponse with a generic message.
// Safe to call from many request threads at once: stages share no per-request state.
class RequestOrchestrator
{
public:
    RequestOrchestrator(TempFileManager& temp_files, ExtractionStage& extraction, AnonymizationStage& anonymization,
                        UploadLimits limits = {}, IPipelineObserver* observer = nullptr);

    [[nodiscard]] PipelineResponse process(const UploadedFile& upload);

    const UploadLimits& limits() const { return limits_; }

private:
    PipelineResponse runPipeline(const RequestContext& ctx, const UploadedFile& upload);
    PipelineResponse reject(const RequestContext& ctx, ErrorKind kind, const std::string& reason,
                            std::string message);
    std::optional<std::string> validate(const UploadedFile& upload) const;

    template<typename Fn>
    void notify(Fn&& fn) noexcept;

    TempFileManager& temp_files_;
    ExtractionStage& extraction_;
    AnonymizationStage& anonymization_;
    UploadLimits limits_;
    IPipelineObserver* observer_;
    std::atomic<std::uint64_t> next_request_id_{ 1 };
};

} // namespace pipeline
