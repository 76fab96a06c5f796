#pragma once

#include "IProcessInvoker.hpp"

#include <string>

namespace pipeline
{

enum class PayloadMode
{
    Stdin = 0,   // text written to the worker's standard input
    Argument = 1 // text appended as one argv entry
};

enum class AnonymizationOutcome
{
    Transformed, // worker succeeded, text is the redacted output
    FellBack,    // worker failed, text is the original input
    Skipped      // stage disabled, text is the original input
};

struct AnonymizationResult
{
    std::string text;
    AnonymizationOutcome outcome = AnonymizationOutcome::Skipped;
    std::string reason; // why the stage fell back or was skipped

    bool fellBack() const { return outcome == AnonymizationOutcome::FellBack; }
};

const char* to_string(AnonymizationOutcome outcome) noexcept;

// Best-effort stage. Never throws for worker problems and never returns less
// than it was given: on any failure the input text comes back unchanged.
class AnonymizationStage
{
public:
    AnonymizationStage(IProcessInvoker& invoker, WorkerCommand worker, PayloadMode mode = PayloadMode::Stdin,
                       bool enabled = true);

    [[nodiscard]] AnonymizationResult anonymize(const std::string& text);

    bool enabled() const { return enabled_; }
    PayloadMode payloadMode() const { return mode_; }

private:
    AnonymizationResult fallBack(const std::string& text, std::string reason, const std::string& details);

    IProcessInvoker& invoker_;
    WorkerCommand worker_;
    PayloadMode mode_;
    bool enabled_;
};

} // namespace pipeline
