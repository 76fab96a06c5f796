#include "Application.hpp"

#include "../config/ConfigManager.hpp"
#include "../config/ServiceConfig.hpp"
#include "../pipeline/AnonymizationStage.hpp"
#include "../pipeline/Diagnostics.hpp"
#include "../pipeline/ExtractionStage.hpp"
#include "../pipeline/LoggingPipelineObserver.hpp"
#include "../pipeline/PosixProcessInvoker.hpp"
#include "../pipeline/RequestOrchestrator.hpp"
#include "../pipeline/TempFileManager.hpp"
#include "../server/HttpServer.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <pthread.h>

namespace
{

// SIGUSR1 only wakes the signal thread during shutdown
sigset_t shutdownSignals()
{
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    sigaddset(&set, SIGUSR1);
    return set;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    const std::string program = argc_ > 0 ? argv_[0] : "cvscrub";
    std::vector<std::string> args;
    for (int i = 1; i < argc_; ++i)
        args.emplace_back(argv_[i]);

    std::string error;
    auto parsed = ParseCommandLine(args, error);
    if (!parsed)
    {
        std::cerr << program << ": " << error << "\n\n" << UsageText(program);
        return 2;
    }
    options_ = *parsed;

    if (options_.show_help)
    {
        std::cout << UsageText(program);
        return 0;
    }

    if (!initialize())
    {
        cleanup();
        return 1;
    }

    bool ok = true;
    if (!quit_requested_.load())
        ok = server_->serve();

    cleanup();
    return ok ? 0 : 1;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
    if (server_)
        server_->stop();
}

bool Application::initialize()
{
    // Config is read before logging exists; its warnings are replayed once loggers are up
    if (!initializeConfig())
        return false;

    if (!initializeLogging())
        return false;

    if (!startSignalThread())
        return false;

    setupPipeline();
    return setupServer();
}

bool Application::initializeConfig()
{
    service_config_ = std::make_unique<ServiceConfig>();
    config_ = std::make_unique<ConfigManager>(options_.config_path);

    if (!service_config_->registerConfigHandlers(*config_))
    {
        std::cerr << "Failed to register configuration handlers: " << config_->lastError() << "\n";
        return false;
    }

    // A parse error keeps the defaults; it is reported, not fatal
    config_->load();

    if (options_.port)
        service_config_->server.port = *options_.port;
    if (options_.verbose)
        service_config_->logging.verbose_pipeline = true;
    return true;
}

bool Application::initializeLogging()
{
    const LoggingConfig& logging = service_config_->logging;

    if (!utils::LogManager::Initialize(logging.level, logging.append))
    {
        std::cerr << "Failed to initialize logging system\n";
        return false;
    }

    bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                     .filepath = logging.file,
                                                     .append_override = std::nullopt,
                                                     .level_override = std::nullopt,
                                                     .max_file_size = 10 * 1024 * 1024,
                                                     .backup_count = 3,
                                                     .add_console_appender = logging.console });

    ok &= utils::LogManager::RegisterLogger<pipeline::Diagnostics::kLogInstance>(
        { .name = "pipeline",
          .filepath = logging.pipeline_file,
          .append_override = std::nullopt,
          .level_override = std::nullopt,
          .max_file_size = 10 * 1024 * 1024,
          .backup_count = 3,
          .add_console_appender = false });

    if (!ok)
    {
        std::cerr << "Failed to open log files " << logging.file << ", " << logging.pipeline_file << "\n";
        return false;
    }

    const auto log_dir = std::filesystem::path(logging.file).parent_path();
    utils::ErrorReporter::InitializeLogFile((log_dir / "errors.log").string(),
                                            logging.append ? std::ios::app : std::ios::trunc);

    pipeline::Diagnostics::SetVerbose(logging.verbose_pipeline);
    pipeline::Diagnostics::SetMaxPreview(logging.preview_bytes);

    PLOG_INFO << "cvscrub starting, config " << config_->path();
    for (const auto& report : utils::ErrorReporter::GetHistorySnapshot())
    {
        if (report.category == utils::ErrorCategory::Configuration)
            PLOG_WARNING << "Config: " << report.user_message << " (" << report.technical_details << ")";
    }
    return true;
}

void Application::setupPipeline()
{
    const ServiceConfig& cfg = *service_config_;

    temp_files_ = std::make_unique<pipeline::TempFileManager>(cfg.storage.temp_dir);
    invoker_ = std::make_unique<pipeline::PosixProcessInvoker>();

    pipeline::WorkerCommand extractor{ cfg.extractor.command, cfg.extractor.args,
                                       timeoutFromSeconds(cfg.extractor.timeout_seconds) };
    extraction_ = std::make_unique<pipeline::ExtractionStage>(*invoker_, std::move(extractor));

    pipeline::WorkerCommand anonymizer{ cfg.anonymizer.command, cfg.anonymizer.args,
                                        timeoutFromSeconds(cfg.anonymizer.timeout_seconds) };
    const auto mode = cfg.anonymizer.payload_mode == AnonymizerConfig::PayloadMode::Argument
                          ? pipeline::PayloadMode::Argument
                          : pipeline::PayloadMode::Stdin;
    anonymization_ = std::make_unique<pipeline::AnonymizationStage>(*invoker_, std::move(anonymizer), mode,
                                                                    cfg.anonymizer.enabled);

    observer_ = std::make_unique<pipeline::LoggingPipelineObserver>();

    pipeline::UploadLimits limits;
    limits.max_bytes = cfg.server.max_upload_bytes;
    limits.accepted_mime_type = cfg.server.accepted_mime_type;
    orchestrator_ = std::make_unique<pipeline::RequestOrchestrator>(*temp_files_, *extraction_, *anonymization_,
                                                                    limits, observer_.get());

    PLOG_INFO << "Scratch directory: " << temp_files_->directory().string();
    PLOG_INFO << "Extractor: " << cfg.extractor.command << " (timeout " << cfg.extractor.timeout_seconds << "s)";
    PLOG_INFO << "Anonymizer: " << (cfg.anonymizer.enabled ? cfg.anonymizer.command : std::string("disabled"))
              << " payload=" << to_string(cfg.anonymizer.payload_mode) << " (timeout "
              << cfg.anonymizer.timeout_seconds << "s)";
}

bool Application::setupServer()
{
    const ServerConfig& cfg = service_config_->server;

    server::ServerOptions options;
    options.host = cfg.host;
    options.port = cfg.port;
    options.thread_count = cfg.thread_count;
    options.endpoint = cfg.endpoint;
    options.max_upload_bytes = cfg.max_upload_bytes;

    server_ = std::make_unique<server::HttpServer>(*orchestrator_, options);
    return server_->bind();
}

bool Application::startSignalThread()
{
    // Blocked before any other thread exists so every thread inherits the mask
    sigset_t set = shutdownSignals();
    const int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, "Failed to block shutdown signals",
                                          std::strerror(rc));
        return false;
    }

    signal_thread_ = std::thread(&Application::signalLoop, this);
    return true;
}

void Application::signalLoop()
{
    sigset_t set = shutdownSignals();
    for (;;)
    {
        int sig = 0;
        const int rc = sigwait(&set, &sig);
        if (rc != 0)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Server, "sigwait failed", std::strerror(rc));
            return;
        }

        if (sig == SIGUSR1)
        {
            if (quit_requested_.load())
                return;
            continue;
        }

        PLOG_INFO << "Received " << strsignal(sig) << ", shutting down";
        requestExit();
        return;
    }
}

void Application::stopSignalThread()
{
    if (!signal_thread_.joinable())
        return;

    quit_requested_ = true;
    pthread_kill(signal_thread_.native_handle(), SIGUSR1);
    signal_thread_.join();
}

void Application::logCounters() const
{
    if (observer_)
    {
        const auto c = observer_->counters();
        PLOG_INFO << "Requests: responded=" << c.responded << " validated=" << c.validated
                  << " rejected=" << c.rejected << " extraction_failures=" << c.extraction_failures;
        PLOG_INFO << "Anonymization: transformed=" << c.anonymized << " fallbacks=" << c.fallbacks
                  << " skipped=" << c.skipped;
    }
    if (temp_files_)
    {
        PLOG_INFO << "Temp files: acquired=" << temp_files_->acquiredCount()
                  << " released=" << temp_files_->releasedCount();
    }
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    stopSignalThread();
    if (server_)
        server_->stop();

    logCounters();

    server_.reset();
    orchestrator_.reset();
    observer_.reset();
    anonymization_.reset();
    extraction_.reset();
    invoker_.reset();
    temp_files_.reset();

    PLOG_INFO << "cvscrub stopped";
    utils::LogManager::Shutdown();
}
