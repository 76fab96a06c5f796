#include "HttpServer.hpp"
#include "../pipeline/RequestOrchestrator.hpp"
#include "../utils/ErrorReporter.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <exception>

using json = nlohmann::json;

namespace server
{

namespace
{

constexpr const char* kJsonContentType = "application/json; charset=utf-8";

void reply_json(httplib::Response& res, int status, const json& body)
{
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJsonContentType);
}

void reply_message(httplib::Response& res, int status, const std::string& message)
{
    reply_json(res, status, json{ { "message", message } });
}

std::string message_for_status(int status)
{
    switch (status)
    {
    case 404:
        return "Not found";
    case 405:
        return "Method not allowed";
    case 413:
        return "Request body too large";
    case 400:
        return "Bad request";
    default:
        return status >= 500 ? pipeline::messages::kProcessingFailed : "Request failed";
    }
}

} // namespace

json to_json(const pipeline::PipelineResult& result)
{
    return json{ { "text", result.processed_text },
                 { "rawText", result.raw_text },
                 { "filename", result.filename },
                 { "size", result.size_bytes } };
}

HttpServer::HttpServer(pipeline::RequestOrchestrator& orchestrator, ServerOptions options)
    : orchestrator_(orchestrator)
    , options_(std::move(options))
    , server_(std::make_unique<httplib::Server>())
{
    const auto threads = static_cast<size_t>(options_.thread_count > 0 ? options_.thread_count : 1);
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_->set_payload_max_length(static_cast<size_t>(options_.max_upload_bytes + kMultipartOverhead));

    server_->set_error_handler(
        [](const httplib::Request&, httplib::Response& res)
        {
            if (res.body.empty())
                reply_message(res, res.status, message_for_status(res.status));
        });

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep)
        {
            std::string details = req.method + " " + req.path;
            try
            {
                if (ep)
                    std::rethrow_exception(ep);
            }
            catch (const std::exception& ex)
            {
                details += ": " + std::string(ex.what());
            }
            catch (...)
            {
                details += ": unknown exception";
            }
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Server, "Unhandled exception in handler",
                                              details);
            reply_message(res, 500, pipeline::messages::kProcessingFailed);
        });

    server_->set_logger(
        [](const httplib::Request& req, const httplib::Response& res)
        {
            PLOG_DEBUG << req.method << " " << req.path << " -> " << res.status << " (" << req.remote_addr
                       << ")";
        });

    registerRoutes();
}

HttpServer::~HttpServer()
{
    stop();
}

void HttpServer::registerRoutes()
{
    server_->Post(options_.endpoint,
                  [this](const httplib::Request& req, httplib::Response& res) { handleExtract(req, res); });
}

void HttpServer::handleExtract(const httplib::Request& req, httplib::Response& res)
{
    if (!req.is_multipart_form_data() || !req.has_file("file"))
    {
        reply_message(res, 400, pipeline::messages::kNoFile);
        return;
    }

    const auto& part = req.get_file_value("file");

    pipeline::UploadedFile upload;
    upload.name = part.filename;
    upload.declared_mime_type = part.content_type;
    upload.size_bytes = part.content.size();
    upload.content = part.content;

    pipeline::PipelineResponse response = orchestrator_.process(upload);
    const int status = pipeline::http_status_for(response.error_kind);

    if (response.ok())
        reply_json(res, status, to_json(*response.result));
    else
        reply_message(res, status, response.message);
}

bool HttpServer::bind()
{
    if (options_.port == 0)
    {
        bound_port_ = server_->bind_to_any_port(options_.host);
    }
    else
    {
        bound_port_ = server_->bind_to_port(options_.host, options_.port) ? options_.port : -1;
    }

    if (bound_port_ <= 0)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to bind HTTP server",
                                          options_.host + ":" + std::to_string(options_.port));
        bound_port_ = -1;
        return false;
    }

    PLOG_INFO << "HTTP server bound to " << options_.host << ":" << bound_port_ << ", POST " << options_.endpoint;
    return true;
}

bool HttpServer::serve()
{
    if (bound_port_ <= 0)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Server, "HTTP server started without a bound socket");
        return false;
    }

    const bool ok = server_->listen_after_bind();
    PLOG_INFO << "HTTP server stopped";
    return ok;
}

void HttpServer::stop()
{
    if (server_ && server_->is_running())
        server_->stop();
}

void HttpServer::waitUntilReady() const
{
    server_->wait_until_ready();
}

bool HttpServer::isRunning() const
{
    return server_ && server_->is_running();
}

} // namespace server
