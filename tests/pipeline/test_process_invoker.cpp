#include <catch2/catch_test_macros.hpp>

#include "pipeline/PosixProcessInvoker.hpp"

#include <chrono>
#include <string>

using namespace pipeline;
using namespace std::chrono_literals;

namespace {

WorkerInvocation shell(const std::string& script) {
    WorkerInvocation inv;
    inv.command = "/bin/sh";
    inv.args = {"-c", script};
    return inv;
}

}  // namespace

TEST_CASE("PosixProcessInvoker captures worker output", "[process]") {
    PosixProcessInvoker invoker;

    SECTION("Successful worker: stdout trimmed, exit code 0") {
        auto outcome = invoker.run(shell("printf '  John Doe, Software Engineer\\n\\n'"));
        REQUIRE(outcome.spawned());
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.exit_code == 0);
        REQUIRE(outcome.stdout_data == "John Doe, Software Engineer");
    }

    SECTION("Arguments are passed verbatim, no shell expansion") {
        WorkerInvocation inv;
        inv.command = "/bin/echo";
        inv.args = {"$HOME", "two words", "'quoted'"};
        auto outcome = invoker.run(inv);
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.stdout_data == "$HOME two words 'quoted'");
    }

    SECTION("Non-zero exit keeps stderr") {
        auto outcome = invoker.run(shell("echo 'corrupt PDF' >&2; exit 1"));
        REQUIRE(outcome.spawned());
        REQUIRE_FALSE(outcome.succeeded());
        REQUIRE(outcome.exit_code == 1);
        REQUIRE(outcome.stderr_data.find("corrupt PDF") != std::string::npos);
    }

    SECTION("Missing executable is a spawn failure") {
        WorkerInvocation inv;
        inv.command = "/nonexistent/cvscrub-worker";
        auto outcome = invoker.run(inv);
        REQUIRE_FALSE(outcome.spawned());
        REQUIRE(outcome.spawn_error.has_value());
        REQUIRE_FALSE(outcome.succeeded());
    }

    SECTION("Empty command is a spawn failure") {
        WorkerInvocation inv;
        auto outcome = invoker.run(inv);
        REQUIRE_FALSE(outcome.spawned());
    }

    SECTION("Signal termination reports 128 + signal") {
        auto outcome = invoker.run(shell("kill -9 $$"));
        REQUIRE(outcome.spawned());
        REQUIRE(outcome.exit_code == 128 + 9);
    }
}

TEST_CASE("PosixProcessInvoker feeds stdin", "[process]") {
    PosixProcessInvoker invoker;

    SECTION("Payload reaches the worker") {
        auto inv = shell("cat");
        inv.stdin_payload = "John Doe, Software Engineer";
        auto outcome = invoker.run(inv);
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.stdout_data == "John Doe, Software Engineer");
    }

    SECTION("Large payload does not deadlock") {
        auto inv = shell("cat");
        std::string payload(2 * 1024 * 1024, 'a');
        payload.back() = 'z';
        inv.stdin_payload = payload;
        auto outcome = invoker.run(inv, 30s);
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.stdout_data.size() == payload.size());
        REQUIRE(outcome.stdout_data.back() == 'z');
    }

    SECTION("Worker that ignores stdin still completes") {
        auto inv = shell("echo done");
        inv.stdin_payload = std::string(1024 * 1024, 'x');
        auto outcome = invoker.run(inv, 30s);
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.stdout_data == "done");
    }
}

TEST_CASE("PosixProcessInvoker enforces the timeout", "[process][timeout]") {
    PosixProcessInvoker invoker;

    SECTION("Hung worker is killed") {
        const auto started = std::chrono::steady_clock::now();
        auto outcome = invoker.run(shell("sleep 30"), 200ms);
        const auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(outcome.spawned());
        REQUIRE(outcome.timed_out);
        REQUIRE_FALSE(outcome.succeeded());
        REQUIRE(elapsed < 10s);
    }

    SECTION("Worker that closes its output but keeps running is killed") {
        auto outcome = invoker.run(shell("exec >/dev/null 2>&1; sleep 30"), 200ms);
        REQUIRE(outcome.timed_out);
    }

    SECTION("Fast worker is unaffected") {
        auto outcome = invoker.run(shell("echo quick"), 5s);
        REQUIRE_FALSE(outcome.timed_out);
        REQUIRE(outcome.stdout_data == "quick");
    }
}
