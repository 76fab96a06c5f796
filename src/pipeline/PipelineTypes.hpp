#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pipeline {

// Core data contracts for the ingestion pipeline.
// Every stage consumes and produces these types so the orchestrator stays thin.

enum class ErrorKind
{
    None = 0,
    Validation,   // wrong declared type, size over limit, missing file
    Storage,      // temp resource could not be written
    Extraction,   // extraction worker failed to start, exited non-zero or timed out
    Unexpected    // anything else
};

// Upload as received from the transport layer. Immutable for the request.
struct UploadedFile {
    std::string name;                         // Original client-side file name
    std::string declared_mime_type;           // Content-Type of the form part
    std::uint64_t size_bytes = 0;             // Size reported for the part
    std::string content;                      // Raw bytes
};

// Request-scoped scratch file. Released exactly once by TempFileManager.
struct TempResource {
    std::filesystem::path path;
    bool bytes_written = false;
    bool released = false;
};

// One call into an external worker.
struct WorkerInvocation {
    std::string command;                      // Executable name or path (PATH lookup applies)
    std::vector<std::string> args;            // argv[1..]
    std::optional<std::string> stdin_payload; // Written to the worker's stdin, then closed
};

// Result of one worker invocation. Produced once, consumed immediately.
struct WorkerOutcome {
    int exit_code = -1;
    std::string stdout_data;                  // Trimmed of surrounding whitespace
    std::string stderr_data;
    std::optional<std::string> spawn_error;   // Set when the worker never started
    bool timed_out = false;                   // Killed after the invocation deadline
    std::chrono::milliseconds elapsed{ 0 };

    bool spawned() const { return !spawn_error.has_value(); }
    bool succeeded() const { return spawned() && !timed_out && exit_code == 0; }
};

// Terminal artifact returned to the caller.
struct PipelineResult {
    std::string raw_text;
    std::string processed_text;               // == raw_text when anonymization was skipped or fell back
    std::string filename;
    std::uint64_t size_bytes = 0;
};

// What the orchestrator hands back to the transport layer. Never throws out of the pipeline.
struct PipelineResponse {
    ErrorKind error_kind = ErrorKind::None;
    std::optional<PipelineResult> result;
    std::string message;                      // Caller-visible, generic on failure

    bool ok() const { return error_kind == ErrorKind::None && result.has_value(); }
};

// Stage execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result{};                               // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    ErrorKind error_kind = ErrorKind::None;   // Classification of the failure, if any
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{ 0 };  // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(ErrorKind kind, const std::string& err, std::chrono::microseconds time,
                               const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error_kind = kind;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

int http_status_for(ErrorKind kind) noexcept;
const char* to_string(ErrorKind kind) noexcept;

} // namespace pipeline
