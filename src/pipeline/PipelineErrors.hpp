#pragma once

#include "PipelineTypes.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pipeline
{

class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string& what, std::string details = {})
        : std::runtime_error(what)
        , kind_(kind)
        , details_(std::move(details))
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

    // Internal diagnostics (worker stderr, errno text). Logged, never sent to the caller.
    const std::string& details() const noexcept { return details_; }

private:
    ErrorKind kind_;
    std::string details_;
};

class ValidationError : public PipelineError
{
public:
    explicit ValidationError(const std::string& what)
        : PipelineError(ErrorKind::Validation, what)
    {
    }
};

// Scratch storage could not be written.
class StorageError : public PipelineError
{
public:
    explicit StorageError(const std::string& what)
        : PipelineError(ErrorKind::Storage, what)
    {
    }
};

class ExtractionError : public PipelineError
{
public:
    enum class Cause
    {
        Spawn,     // worker could not be started
        Execution, // worker ran and exited non-zero
        Timeout    // worker was killed after the deadline
    };

    ExtractionError(Cause cause, const std::string& what, std::string diagnostic = {})
        : PipelineError(ErrorKind::Extraction, what, std::move(diagnostic))
        , cause_(cause)
    {
    }

    Cause cause() const noexcept { return cause_; }

private:
    Cause cause_;
};

} // namespace pipeline
