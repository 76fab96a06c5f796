#include "LoggingPipelineObserver.hpp"
#include "Diagnostics.hpp"

#include <plog/Log.h>

#include <sstream>

namespace pipeline
{

namespace
{
constexpr auto kRelaxed = std::memory_order_relaxed;
}

void LoggingPipelineObserver::onValidated(const RequestContext& ctx)
{
    validated_.fetch_add(1, kRelaxed);
    PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id << " stage=validated file="
                                          << Diagnostics::Preview(ctx.filename) << " size=" << ctx.size_bytes;
}

void LoggingPipelineObserver::onRejected(const RequestContext& ctx, ErrorKind kind, const std::string& reason)
{
    rejected_.fetch_add(1, kRelaxed);
    PLOG_WARNING_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id << " stage=rejected kind="
                                             << to_string(kind) << " reason=" << reason;
}

void LoggingPipelineObserver::onTempWritten(const RequestContext& ctx, const std::filesystem::path& path)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id
                                              << " stage=temp_written path=" << path.string();
}

void LoggingPipelineObserver::onExtracted(const RequestContext& ctx, const std::string& raw_text,
                                          std::chrono::microseconds duration)
{
    std::ostringstream oss;
    oss << "[Pipeline] req=" << ctx.request_id << " stage=extracted status=ok duration=" << duration.count()
        << "us chars=" << raw_text.size();
    if (Diagnostics::IsVerbose())
        oss << " raw=" << Diagnostics::Preview(raw_text);
    PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

void LoggingPipelineObserver::onExtractionFailed(const RequestContext& ctx, const std::string& reason)
{
    extraction_failures_.fetch_add(1, kRelaxed);
    PLOG_ERROR_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id
                                           << " stage=extracted status=error reason=" << reason;
}

void LoggingPipelineObserver::onAnonymized(const RequestContext& ctx, const AnonymizationResult& result,
                                           std::chrono::microseconds duration)
{
    switch (result.outcome)
    {
    case AnonymizationOutcome::Transformed:
        anonymized_.fetch_add(1, kRelaxed);
        break;
    case AnonymizationOutcome::FellBack:
        fallbacks_.fetch_add(1, kRelaxed);
        break;
    case AnonymizationOutcome::Skipped:
        skipped_.fetch_add(1, kRelaxed);
        break;
    }

    std::ostringstream oss;
    oss << "[Pipeline] req=" << ctx.request_id << " stage=anonymized status=" << to_string(result.outcome)
        << " duration=" << duration.count() << "us";
    if (!result.reason.empty())
        oss << " reason=" << result.reason;
    if (Diagnostics::IsVerbose())
        oss << " output=" << Diagnostics::Preview(result.text);

    if (result.fellBack())
        PLOG_WARNING_(Diagnostics::kLogInstance) << oss.str();
    else
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
}

void LoggingPipelineObserver::onTempReleased(const RequestContext& ctx, const std::filesystem::path& path)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id
                                              << " stage=temp_released path=" << path.string();
}

void LoggingPipelineObserver::onResponded(const RequestContext& ctx, int http_status)
{
    responded_.fetch_add(1, kRelaxed);
    PLOG_INFO_(Diagnostics::kLogInstance) << "[Pipeline] req=" << ctx.request_id << " stage=responded status="
                                          << http_status;
}

PipelineCounters LoggingPipelineObserver::counters() const
{
    PipelineCounters c;
    c.validated = validated_.load(kRelaxed);
    c.rejected = rejected_.load(kRelaxed);
    c.extraction_failures = extraction_failures_.load(kRelaxed);
    c.anonymized = anonymized_.load(kRelaxed);
    c.fallbacks = fallbacks_.load(kRelaxed);
    c.skipped = skipped_.load(kRelaxed);
    c.responded = responded_.load(kRelaxed);
    return c;
}

} // namespace pipeline
