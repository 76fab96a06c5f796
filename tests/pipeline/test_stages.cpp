#include <catch2/catch_test_macros.hpp>

#include "pipeline/AnonymizationStage.hpp"
#include "pipeline/ExtractionStage.hpp"
#include "pipeline/PipelineErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/mock_process_invoker.hpp"

#include <chrono>
#include <string>

using namespace pipeline;
using test_utils::MockOutcomes;
using test_utils::MockProcessInvoker;
using namespace std::chrono_literals;

TEST_CASE("ExtractionStage", "[extraction]") {
    MockProcessInvoker invoker;
    ExtractionStage stage(invoker, WorkerCommand{"extract", {"scripts/extract_text.py"}, 120s});

    SECTION("Passes the path as the last argument and returns stdout") {
        invoker.setOutcome("extract", MockOutcomes::success("John Doe, Software Engineer"));
        REQUIRE(stage.extract("/tmp/cv.pdf") == "John Doe, Software Engineer");

        auto calls = invoker.invocations();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].args.size() == 2);
        REQUIRE(calls[0].args[0] == "scripts/extract_text.py");
        REQUIRE(calls[0].args[1] == "/tmp/cv.pdf");
        REQUIRE_FALSE(calls[0].stdin_payload.has_value());
        REQUIRE(invoker.lastTimeout() == std::chrono::milliseconds(120s));
    }

    SECTION("Invalid UTF-8 in worker output is repaired") {
        invoker.setOutcome("extract", MockOutcomes::success(std::string("caf") + '\xE9'));
        REQUIRE(stage.extract("/tmp/cv.pdf") == "caf\xEF\xBF\xBD");
    }

    SECTION("Non-zero exit throws with stderr as diagnostic") {
        invoker.setOutcome("extract", MockOutcomes::exitCode(1, "corrupt PDF\n"));
        try {
            (void)stage.extract("/tmp/cv.pdf");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& ex) {
            REQUIRE(ex.cause() == ExtractionError::Cause::Execution);
            REQUIRE(ex.kind() == ErrorKind::Extraction);
            REQUIRE(ex.details() == "corrupt PDF");
            REQUIRE(std::string(ex.what()).find("code 1") != std::string::npos);
        }
    }

    SECTION("Spawn failure throws") {
        invoker.setOutcome("extract", MockOutcomes::spawnFailure("No such file or directory"));
        try {
            (void)stage.extract("/tmp/cv.pdf");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& ex) {
            REQUIRE(ex.cause() == ExtractionError::Cause::Spawn);
        }
    }

    SECTION("Timeout throws") {
        invoker.setOutcome("extract", MockOutcomes::timedOut());
        try {
            (void)stage.extract("/tmp/cv.pdf");
            FAIL("expected ExtractionError");
        } catch (const ExtractionError& ex) {
            REQUIRE(ex.cause() == ExtractionError::Cause::Timeout);
        }
    }

    SECTION("Worker is called exactly once, no retry") {
        invoker.setOutcome("extract", MockOutcomes::exitCode(2, ""));
        REQUIRE_THROWS_AS(stage.extract("/tmp/cv.pdf"), ExtractionError);
        REQUIRE(invoker.callCount("extract") == 1);
    }
}

TEST_CASE("AnonymizationStage falls back instead of failing", "[anonymization]") {
    MockProcessInvoker invoker;
    const std::string raw = "John Doe, Software Engineer";
    utils::ErrorReporter::ClearHistory();

    SECTION("Success returns the worker output") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, std::nullopt});
        invoker.setOutcome("anon", MockOutcomes::success("[NAME], Software Engineer"));

        auto result = stage.anonymize(raw);
        REQUIRE(result.outcome == AnonymizationOutcome::Transformed);
        REQUIRE(result.text == "[NAME], Software Engineer");
        REQUIRE_FALSE(result.fellBack());
    }

    SECTION("Stdin mode sends the text on stdin, not argv") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {"scripts/anonymize_personal_info.py"}, std::nullopt},
                                 PayloadMode::Stdin);
        invoker.setOutcome("anon", MockOutcomes::success("x"));
        (void)stage.anonymize(raw);

        auto calls = invoker.invocations();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].stdin_payload == raw);
        REQUIRE(calls[0].args.size() == 1);
    }

    SECTION("Argument mode appends the text as one argv entry") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {"scripts/anonymize_personal_info.py"}, std::nullopt},
                                 PayloadMode::Argument);
        invoker.setOutcome("anon", MockOutcomes::success("x"));
        (void)stage.anonymize(raw);

        auto calls = invoker.invocations();
        REQUIRE(calls.size() == 1);
        REQUIRE_FALSE(calls[0].stdin_payload.has_value());
        REQUIRE(calls[0].args.size() == 2);
        REQUIRE(calls[0].args[1] == raw);
    }

    SECTION("Non-zero exit falls back to the raw text") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, std::nullopt});
        invoker.setOutcome("anon", MockOutcomes::exitCode(1, "model not found"));

        auto result = stage.anonymize(raw);
        REQUIRE(result.fellBack());
        REQUIRE(result.text == raw);
        REQUIRE(result.reason.find("code 1") != std::string::npos);
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Anonymization) == 1);
    }

    SECTION("Spawn failure falls back") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, std::nullopt});
        invoker.setOutcome("anon", MockOutcomes::spawnFailure("No such file or directory"));

        auto result = stage.anonymize(raw);
        REQUIRE(result.fellBack());
        REQUIRE(result.text == raw);
    }

    SECTION("Timeout falls back") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, 1s});
        invoker.setOutcome("anon", MockOutcomes::timedOut());

        auto result = stage.anonymize(raw);
        REQUIRE(result.fellBack());
        REQUIRE(result.text == raw);
    }

    SECTION("Empty output for non-empty input falls back") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, std::nullopt});
        invoker.setOutcome("anon", MockOutcomes::success(""));

        auto result = stage.anonymize(raw);
        REQUIRE(result.fellBack());
        REQUIRE(result.text == raw);
    }

    SECTION("Disabled stage skips the worker") {
        AnonymizationStage stage(invoker, WorkerCommand{"anon", {}, std::nullopt}, PayloadMode::Stdin, false);

        auto result = stage.anonymize(raw);
        REQUIRE(result.outcome == AnonymizationOutcome::Skipped);
        REQUIRE(result.text == raw);
        REQUIRE(invoker.totalCalls() == 0);
    }
}
