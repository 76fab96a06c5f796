#include "TempFileManager.hpp"
#include "PipelineErrors.hpp"
#include "TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pipeline
{

namespace
{

constexpr int kMaxCreateAttempts = 8;

std::string errno_text(int err)
{
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

// Writes everything or returns the errno of the failing write.
int write_all(int fd, std::string_view content)
{
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0)
    {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return errno;
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return 0;
}

} // namespace

TempFileManager::TempFileManager(fs::path directory)
    : directory_(std::move(directory))
{
    if (directory_.empty())
    {
        std::error_code ec;
        directory_ = fs::temp_directory_path(ec);
        if (ec)
            directory_ = "/tmp";
    }
}

void TempFileManager::ensureDirectory()
{
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
        throw StorageError("cannot create scratch directory " + directory_.string() + ": " + ec.message());
}

fs::path TempFileManager::makeCandidatePath(const std::string& safe_name)
{
    const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    const auto seq = sequence_.fetch_add(1, std::memory_order_relaxed);

    std::string file_name = "cvscrub_" + std::to_string(now_ns) + "_" + std::to_string(::getpid()) + "_" +
                            std::to_string(seq) + "_" + safe_name;
    return directory_ / file_name;
}

TempResource TempFileManager::acquire(std::string_view content, std::string_view suggested_name)
{
    ensureDirectory();

    const std::string safe_name = sanitize_file_name(suggested_name);

    for (int attempt = 0; attempt < kMaxCreateAttempts; ++attempt)
    {
        fs::path candidate = makeCandidatePath(safe_name);

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd < 0)
        {
            if (errno == EEXIST)
            {
                PLOG_DEBUG << "Temp path collision, retrying: " << candidate.string();
                continue;
            }
            throw StorageError("cannot create temp file " + candidate.string() + ": " + errno_text(errno));
        }

        const int write_err = write_all(fd, content);
        const int close_err = (::close(fd) != 0) ? errno : 0;
        if (write_err != 0 || close_err != 0)
        {
            std::error_code ec;
            fs::remove(candidate, ec);
            throw StorageError("cannot write temp file " + candidate.string() + ": " +
                               errno_text(write_err != 0 ? write_err : close_err));
        }

        acquired_.fetch_add(1, std::memory_order_relaxed);

        TempResource resource;
        resource.path = std::move(candidate);
        resource.bytes_written = true;
        PLOG_DEBUG << "Temp file written: " << resource.path.string() << " (" << content.size() << " bytes)";
        return resource;
    }

    throw StorageError("cannot allocate a unique temp file name in " + directory_.string());
}

void TempFileManager::release(TempResource& resource) noexcept
{
    if (resource.released || resource.path.empty())
        return;
    resource.released = true;
    released_.fetch_add(1, std::memory_order_relaxed);

    std::error_code ec;
    const bool removed = fs::remove(resource.path, ec);
    if (ec)
    {
        try
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "Failed to delete temp file",
                                                resource.path.string() + ": " + ec.message());
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Failed to report temp file deletion failure: " << ex.what();
        }
        return;
    }

    if (!removed)
        PLOG_DEBUG << "Temp file already gone: " << resource.path.string();
}

} // namespace pipeline
