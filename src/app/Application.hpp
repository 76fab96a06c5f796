#pragma once

#include "CommandLine.hpp"

#include <atomic>
#include <memory>
#include <thread>

class ConfigManager;
struct ServiceConfig;

namespace pipeline
{
class TempFileManager;
class IProcessInvoker;
class ExtractionStage;
class AnonymizationStage;
class LoggingPipelineObserver;
class RequestOrchestrator;
} // namespace pipeline

namespace server
{
class HttpServer;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    bool initialize();
    bool initializeConfig();
    bool initializeLogging();
    void setupPipeline();
    bool setupServer();

    bool startSignalThread();
    void stopSignalThread();
    void signalLoop();

    void logCounters() const;
    void cleanup();

    int argc_;
    char** argv_;
    CommandLineOptions options_;

    std::unique_ptr<ServiceConfig> service_config_;
    std::unique_ptr<ConfigManager> config_;

    std::unique_ptr<pipeline::TempFileManager> temp_files_;
    std::unique_ptr<pipeline::IProcessInvoker> invoker_;
    std::unique_ptr<pipeline::ExtractionStage> extraction_;
    std::unique_ptr<pipeline::AnonymizationStage> anonymization_;
    std::unique_ptr<pipeline::LoggingPipelineObserver> observer_;
    std::unique_ptr<pipeline::RequestOrchestrator> orchestrator_;
    std::unique_ptr<server::HttpServer> server_;

    std::thread signal_thread_;
    std::atomic<bool> quit_requested_{ false };
    bool cleaned_up_ = false;
};
