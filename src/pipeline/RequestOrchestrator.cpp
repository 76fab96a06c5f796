#include "RequestOrchestrator.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace pipeline
{

namespace messages
{

std::string fileTooLarge(std::uint64_t max_bytes)
{
    constexpr std::uint64_t kMiB = 1024 * 1024;
    if (max_bytes >= kMiB && max_bytes % kMiB == 0)
        return "File too large. Maximum size is " + std::to_string(max_bytes / kMiB) + "MB.";
    return "File too large. Maximum size is " + std::to_string(max_bytes) + " bytes.";
}

} // namespace messages

RequestOrchestrator::RequestOrchestrator(TempFileManager& temp_files, ExtractionStage& extraction,
                                         AnonymizationStage& anonymization, UploadLimits limits,
                                         IPipelineObserver* observer)
    : temp_files_(temp_files)
    , extraction_(extraction)
    , anonymization_(anonymization)
    , limits_(std::move(limits))
    , observer_(observer)
{
}

template<typename Fn>
void RequestOrchestrator::notify(Fn&& fn) noexcept
{
    if (!observer_)
        return;
    try
    {
        fn(*observer_);
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Pipeline observer threw: " << ex.what();
    }
}

PipelineResponse RequestOrchestrator::process(const UploadedFile& upload)
{
    RequestContext ctx;
    ctx.request_id = next_request_id_.fetch_add(1, std::memory_order_relaxed);
    ctx.filename = upload.name;
    ctx.size_bytes = upload.size_bytes;

    PipelineResponse response;
    try
    {
        response = runPipeline(ctx, upload);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Request failed unexpectedly",
                                          "request " + std::to_string(ctx.request_id) + ": " + ex.what());
        response = PipelineResponse{ ErrorKind::Unexpected, std::nullopt, messages::kProcessingFailed };
    }
    catch (...)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Unknown, "Request failed unexpectedly",
                                          "request " + std::to_string(ctx.request_id) + ": unknown exception");
        response = PipelineResponse{ ErrorKind::Unexpected, std::nullopt, messages::kProcessingFailed };
    }

    const int status = http_status_for(response.error_kind);
    notify([&](IPipelineObserver& o) { o.onResponded(ctx, status); });
    return response;
}

std::optional<std::string> RequestOrchestrator::validate(const UploadedFile& upload) const
{
    if (upload.declared_mime_type != limits_.accepted_mime_type)
        return std::string(messages::kInvalidType);

    if (upload.size_bytes > limits_.max_bytes || upload.content.size() > limits_.max_bytes)
        return messages::fileTooLarge(limits_.max_bytes);

    return std::nullopt;
}

PipelineResponse RequestOrchestrator::reject(const RequestContext& ctx, ErrorKind kind, const std::string& reason,
                                             std::string message)
{
    notify([&](IPipelineObserver& o) { o.onRejected(ctx, kind, reason); });
    return PipelineResponse{ kind, std::nullopt, std::move(message) };
}

PipelineResponse RequestOrchestrator::runPipeline(const RequestContext& ctx, const UploadedFile& upload)
{
    if (auto problem = validate(upload))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Validation, utils::ErrorSeverity::Info,
                                          "Upload rejected", *problem + " (declared type '" +
                                                                 upload.declared_mime_type + "', " +
                                                                 std::to_string(upload.size_bytes) + " bytes)");
        return reject(ctx, ErrorKind::Validation, *problem, *problem);
    }
    notify([&](IPipelineObserver& o) { o.onValidated(ctx); });

    auto written = run_stage<TempResource>("temp_write", utils::ErrorCategory::Storage,
                                           [&]() { return temp_files_.acquire(upload.content, upload.name); });
    if (!written.succeeded)
        return reject(ctx, written.error_kind, written.error.value_or("unknown"), messages::kProcessingFailed);

    ScopedTempFile temp(temp_files_, std::move(written.result));
    notify([&](IPipelineObserver& o) { o.onTempWritten(ctx, temp.path()); });

    std::error_code ec;
    fs::path absolute_path = fs::absolute(temp.path(), ec);
    if (ec)
        absolute_path = temp.path();

    auto extracted = run_stage<std::string>("extraction", utils::ErrorCategory::Extraction,
                                            [&]() { return extraction_.extract(absolute_path.string()); });
    if (!extracted.succeeded)
    {
        temp.release();
        notify([&](IPipelineObserver& o) { o.onTempReleased(ctx, temp.path()); });
        notify([&](IPipelineObserver& o) { o.onExtractionFailed(ctx, extracted.error.value_or("unknown")); });
        return PipelineResponse{ extracted.error_kind, std::nullopt, messages::kProcessingFailed };
    }
    notify([&](IPipelineObserver& o) { o.onExtracted(ctx, extracted.result, extracted.duration); });

    auto anonymized = run_stage<AnonymizationResult>("anonymization", utils::ErrorCategory::Anonymization,
                                                     [&]() { return anonymization_.anonymize(extracted.result); });
    AnonymizationResult finalized;
    if (anonymized.succeeded)
    {
        finalized = std::move(anonymized.result);
    }
    else
    {
        // The stage itself threw; the fallback policy still applies
        finalized = AnonymizationResult{ extracted.result, AnonymizationOutcome::FellBack,
                                         anonymized.error.value_or("unknown") };
    }

    temp.release();
    notify([&](IPipelineObserver& o) { o.onTempReleased(ctx, temp.path()); });
    notify([&](IPipelineObserver& o) { o.onAnonymized(ctx, finalized, anonymized.duration); });

    PipelineResult result;
    result.raw_text = std::move(extracted.result);
    result.processed_text = std::move(finalized.text);
    result.filename = upload.name;
    result.size_bytes = upload.size_bytes;

    return PipelineResponse{ ErrorKind::None, std::move(result), {} };
}

} // namespace pipeline
