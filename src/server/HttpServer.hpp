#pragma once

#include "../pipeline/PipelineTypes.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace httplib
{
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace pipeline
{
class RequestOrchestrator;
}

namespace server
{

struct ServerOptions
{
    std::string host = "0.0.0.0";
    int port = 8080;            // 0 binds an ephemeral port
    int thread_count = 8;
    std::string endpoint = "/extract-text";
    std::uint64_t max_upload_bytes = 5ull * 1024 * 1024;
};

// Extra room above the upload limit for multipart boundaries and part headers,
// so an oversize file still reaches validation and gets the JSON 400.
constexpr std::uint64_t kMultipartOverhead = 1024 * 1024;

nlohmann::json to_json(const pipeline::PipelineResult& result);

// HTTP front of the ingestion pipeline. One POST endpoint taking a multipart
// `file` field; every response body is JSON.
class HttpServer
{
public:
    HttpServer(pipeline::RequestOrchestrator& orchestrator, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds the listening socket. Returns false (and reports) when the address is unavailable.
    bool bind();

    // Blocks serving requests until stop(). Requires a successful bind().
    bool serve();

    void stop();

    // Blocks until serve() is accepting connections
    void waitUntilReady() const;

    bool isRunning() const;
    int port() const { return bound_port_; }
    const ServerOptions& options() const { return options_; }

private:
    void registerRoutes();
    void handleExtract(const httplib::Request& req, httplib::Response& res);

    pipeline::RequestOrchestrator& orchestrator_;
    ServerOptions options_;
    std::unique_ptr<httplib::Server> server_;
    int bound_port_ = -1;
};

} // namespace server
