#include "mock_process_invoker.hpp"

namespace test_utils {

void MockProcessInvoker::setHandler(const std::string& command, WorkerHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[command] = std::move(handler);
}

void MockProcessInvoker::setOutcome(const std::string& command, const pipeline::WorkerOutcome& outcome) {
    setHandler(command, [outcome](const pipeline::WorkerInvocation&) { return outcome; });
}

pipeline::WorkerOutcome MockProcessInvoker::run(const pipeline::WorkerInvocation& invocation,
                                                std::optional<std::chrono::milliseconds> timeout) {
    WorkerHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        invocations_.push_back(invocation);
        last_timeout_ = timeout;
        auto it = handlers_.find(invocation.command);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        return MockOutcomes::spawnFailure("no mock worker registered for '" + invocation.command + "'");
    }
    return handler(invocation);
}

std::vector<pipeline::WorkerInvocation> MockProcessInvoker::invocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invocations_;
}

std::size_t MockProcessInvoker::callCount(const std::string& command) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& inv : invocations_) {
        if (inv.command == command) {
            ++count;
        }
    }
    return count;
}

std::size_t MockProcessInvoker::totalCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invocations_.size();
}

std::optional<std::chrono::milliseconds> MockProcessInvoker::lastTimeout() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_timeout_;
}

void MockProcessInvoker::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
    invocations_.clear();
    last_timeout_.reset();
}

pipeline::WorkerOutcome MockOutcomes::success(const std::string& stdout_data, const std::string& stderr_data) {
    pipeline::WorkerOutcome outcome;
    outcome.exit_code = 0;
    outcome.stdout_data = stdout_data;
    outcome.stderr_data = stderr_data;
    return outcome;
}

pipeline::WorkerOutcome MockOutcomes::exitCode(int code, const std::string& stderr_data) {
    pipeline::WorkerOutcome outcome;
    outcome.exit_code = code;
    outcome.stderr_data = stderr_data;
    return outcome;
}

pipeline::WorkerOutcome MockOutcomes::spawnFailure(const std::string& message) {
    pipeline::WorkerOutcome outcome;
    outcome.spawn_error = message;
    return outcome;
}

pipeline::WorkerOutcome MockOutcomes::timedOut() {
    pipeline::WorkerOutcome outcome;
    outcome.exit_code = 128 + 9;
    outcome.timed_out = true;
    outcome.elapsed = std::chrono::milliseconds(50);
    return outcome;
}

}  // namespace test_utils
