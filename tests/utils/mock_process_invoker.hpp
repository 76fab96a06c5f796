#pragma once

#include "pipeline/IProcessInvoker.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace test_utils {

using WorkerHandler = std::function<pipeline::WorkerOutcome(const pipeline::WorkerInvocation&)>;

// In-process stand-in for worker subprocesses, keyed by command name.
// Thread-safe so concurrent orchestrator tests can share one instance.
class MockProcessInvoker : public pipeline::IProcessInvoker {
public:
    // Handler runs on the calling thread, e.g. to inspect the temp file
    void setHandler(const std::string& command, WorkerHandler handler);

    // Fixed outcome for every call to `command`
    void setOutcome(const std::string& command, const pipeline::WorkerOutcome& outcome);

    pipeline::WorkerOutcome run(const pipeline::WorkerInvocation& invocation,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) override;

    std::vector<pipeline::WorkerInvocation> invocations() const;
    std::size_t callCount(const std::string& command) const;
    std::size_t totalCalls() const;
    std::optional<std::chrono::milliseconds> lastTimeout() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, WorkerHandler> handlers_;
    std::vector<pipeline::WorkerInvocation> invocations_;
    std::optional<std::chrono::milliseconds> last_timeout_;
};

// Common worker outcomes
class MockOutcomes {
public:
    static pipeline::WorkerOutcome success(const std::string& stdout_data, const std::string& stderr_data = "");
    static pipeline::WorkerOutcome exitCode(int code, const std::string& stderr_data);
    static pipeline::WorkerOutcome spawnFailure(const std::string& message);
    static pipeline::WorkerOutcome timedOut();
};

}  // namespace test_utils
