#pragma once

#include "PipelineTypes.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace pipeline
{

// Owns the scratch directory shared by all requests. Each request gets its own
// file; uniqueness comes from the generated name plus O_EXCL creation, not from locking.
class TempFileManager
{
public:
    // Empty directory means std::filesystem::temp_directory_path()
    explicit TempFileManager(std::filesystem::path directory = {});

    TempFileManager(const TempFileManager&) = delete;
    TempFileManager& operator=(const TempFileManager&) = delete;

    // Throws StorageError when the directory or the file cannot be written
    [[nodiscard]] TempResource acquire(std::string_view content, std::string_view suggested_name);

    // Best-effort delete. Idempotent: a second call on the same resource is a no-op.
    void release(TempResource& resource) noexcept;

    const std::filesystem::path& directory() const { return directory_; }

    std::uint64_t acquiredCount() const noexcept { return acquired_.load(std::memory_order_relaxed); }
    std::uint64_t releasedCount() const noexcept { return released_.load(std::memory_order_relaxed); }

private:
    std::filesystem::path makeCandidatePath(const std::string& safe_name);
    void ensureDirectory();

    std::filesystem::path directory_;
    std::atomic<std::uint64_t> sequence_{ 0 };
    std::atomic<std::uint64_t> acquired_{ 0 };
    std::atomic<std::uint64_t> released_{ 0 };
};

// Scoped ownership of one TempResource: releases it on every exit path.
class ScopedTempFile
{
public:
    ScopedTempFile(TempFileManager& manager, TempResource resource)
        : manager_(manager)
        , resource_(std::move(resource))
    {
    }

    ~ScopedTempFile() { manager_.release(resource_); }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const TempResource& resource() const { return resource_; }
    const std::filesystem::path& path() const { return resource_.path; }

    // Early release; the destructor then does nothing
    void release() noexcept { manager_.release(resource_); }

private:
    TempFileManager& manager_;
    TempResource resource_;
};

} // namespace pipeline
