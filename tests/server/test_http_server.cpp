#include <catch2/catch_test_macros.hpp>

#include "pipeline/PosixProcessInvoker.hpp"
#include "pipeline/RequestOrchestrator.hpp"
#include "server/HttpServer.hpp"
#include "utils/mock_process_invoker.hpp"
#include "utils/temp_dir.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <thread>

using namespace pipeline;
using test_utils::MockOutcomes;
using test_utils::MockProcessInvoker;
using json = nlohmann::json;

namespace {

// Full service on an ephemeral loopback port, torn down on scope exit
class ServiceUnderTest {
public:
    ServiceUnderTest(IProcessInvoker& invoker, WorkerCommand extractor, WorkerCommand anonymizer)
        : temp_files_(dir_.path()),
          extraction_(invoker, std::move(extractor)),
          anonymization_(invoker, std::move(anonymizer)),
          orchestrator_(temp_files_, extraction_, anonymization_) {
        server::ServerOptions options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.thread_count = 4;
        server_ = std::make_unique<server::HttpServer>(orchestrator_, options);
        REQUIRE(server_->bind());
        thread_ = std::thread([this] { server_->serve(); });
        server_->waitUntilReady();
    }

    ~ServiceUnderTest() {
        server_->stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& path = "/extract-text") const {
        return "http://127.0.0.1:" + std::to_string(server_->port()) + path;
    }

    const TempFileManager& tempFiles() const { return temp_files_; }
    const test_utils::TempDir& dir() const { return dir_; }

private:
    test_utils::TempDir dir_;
    TempFileManager temp_files_;
    ExtractionStage extraction_;
    AnonymizationStage anonymization_;
    RequestOrchestrator orchestrator_;
    std::unique_ptr<server::HttpServer> server_;
    std::thread thread_;
};

std::string pdf_bytes(std::size_t size) {
    std::string data = "%PDF-1.4\n";
    data.resize(size, 'x');
    return data;
}

cpr::Response upload(const std::string& url, const std::string& data, const std::string& filename,
                     const std::string& content_type) {
    return cpr::Post(cpr::Url{url},
                     cpr::Multipart{{"file", cpr::Buffer{data.begin(), data.end(), filename}, content_type}});
}

}  // namespace

TEST_CASE("HTTP endpoint with mocked workers", "[http]") {
    MockProcessInvoker invoker;
    invoker.setOutcome("extract", MockOutcomes::success("John Doe, Software Engineer"));
    invoker.setOutcome("anon", MockOutcomes::success("[NAME], Software Engineer"));
    ServiceUnderTest service(invoker, WorkerCommand{"extract", {}, std::nullopt},
                             WorkerCommand{"anon", {}, std::nullopt});

    SECTION("Valid PDF returns text, rawText, filename and size") {
        auto r = upload(service.url(), pdf_bytes(10240), "cv.pdf", "application/pdf");
        REQUIRE(r.status_code == 200);
        auto body = json::parse(r.text);
        REQUIRE(body["text"] == "[NAME], Software Engineer");
        REQUIRE(body["rawText"] == "John Doe, Software Engineer");
        REQUIRE(body["filename"] == "cv.pdf");
        REQUIRE(body["size"] == 10240);
        REQUIRE(service.dir().fileCount() == 0);
    }

    SECTION("Anonymizer failure still returns 200 with raw text") {
        invoker.setOutcome("anon", MockOutcomes::exitCode(1, "model missing"));
        auto r = upload(service.url(), pdf_bytes(10240), "cv.pdf", "application/pdf");
        REQUIRE(r.status_code == 200);
        auto body = json::parse(r.text);
        REQUIRE(body["text"] == "John Doe, Software Engineer");
        REQUIRE(body["rawText"] == "John Doe, Software Engineer");
    }

    SECTION("Extraction failure returns a generic 500") {
        invoker.setOutcome("extract", MockOutcomes::exitCode(1, "corrupt PDF"));
        auto r = upload(service.url(), pdf_bytes(10240), "cv.pdf", "application/pdf");
        REQUIRE(r.status_code == 500);
        auto body = json::parse(r.text);
        REQUIRE(body["message"] == "Error processing file. Please try again.");
        REQUIRE(service.dir().fileCount() == 0);
    }

    SECTION("Wrong type is a 400 and no worker runs") {
        auto r = upload(service.url(), pdf_bytes(10240), "cv.doc", "application/msword");
        REQUIRE(r.status_code == 400);
        auto body = json::parse(r.text);
        REQUIRE(body["message"] == "Invalid file type. Only PDF files are allowed.");
        REQUIRE(invoker.totalCalls() == 0);
        REQUIRE(service.tempFiles().acquiredCount() == 0);
    }

    SECTION("Oversize upload is a JSON 400") {
        auto r = upload(service.url(), pdf_bytes(5 * 1024 * 1024 + 1), "big.pdf", "application/pdf");
        REQUIRE(r.status_code == 400);
        auto body = json::parse(r.text);
        REQUIRE(body["message"] == "File too large. Maximum size is 5MB.");
        REQUIRE(invoker.totalCalls() == 0);
    }

    SECTION("Missing file field is a 400") {
        auto r = cpr::Post(cpr::Url{service.url()}, cpr::Multipart{{"note", "no file here"}});
        REQUIRE(r.status_code == 400);
        auto body = json::parse(r.text);
        REQUIRE(body["message"] == "No file provided");
    }

    SECTION("Unknown route gets a JSON 404") {
        auto r = cpr::Get(cpr::Url{service.url("/nope")});
        REQUIRE(r.status_code == 404);
        auto body = json::parse(r.text);
        REQUIRE(body.contains("message"));
    }
}

TEST_CASE("HTTP endpoint with real subprocess workers", "[http][process]") {
    PosixProcessInvoker invoker;
    // $1 is the temp file path appended by the extraction stage
    WorkerCommand extractor{"/bin/sh",
                            {"-c", "test -s \"$1\" && printf 'John Doe, Software Engineer\\n'", "extract"},
                            std::chrono::seconds(10)};
    WorkerCommand anonymizer{"/bin/sh", {"-c", "sed 's/John Doe/[NAME]/'"}, std::chrono::seconds(10)};
    ServiceUnderTest service(invoker, extractor, anonymizer);

    auto r = upload(service.url(), pdf_bytes(10240), "cv.pdf", "application/pdf");
    REQUIRE(r.status_code == 200);
    auto body = json::parse(r.text);
    REQUIRE(body["text"] == "[NAME], Software Engineer");
    REQUIRE(body["rawText"] == "John Doe, Software Engineer");
    REQUIRE(body["filename"] == "cv.pdf");
    REQUIRE(body["size"] == 10240);
    REQUIRE(service.tempFiles().acquiredCount() == 1);
    REQUIRE(service.tempFiles().releasedCount() == 1);
    REQUIRE(service.dir().fileCount() == 0);
}
