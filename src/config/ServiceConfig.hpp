#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class ConfigManager;

struct ServerConfig
{
    std::string host;
    int port = 8080;
    int thread_count = 8;
    std::uint64_t max_upload_bytes = 5ull * 1024 * 1024;
    std::string accepted_mime_type;
    std::string endpoint;

    void applyDefaults();
};

struct StorageConfig
{
    std::string temp_dir; // empty: OS temp directory

    void applyDefaults() { temp_dir.clear(); }
};

struct ExtractorConfig
{
    std::string command;
    std::vector<std::string> args;
    std::int64_t timeout_seconds = 120; // 0 disables the timeout

    void applyDefaults();
};

struct AnonymizerConfig
{
    enum class PayloadMode
    {
        Stdin = 0,
        Argument = 1
    };

    bool enabled = true;
    std::string command;
    std::vector<std::string> args;
    PayloadMode payload_mode = PayloadMode::Stdin;
    std::int64_t timeout_seconds = 60;

    void applyDefaults();
};

struct LoggingConfig
{
    int level = 4; // plog severity, 0 none .. 6 verbose
    bool append = true;
    std::string file;
    std::string pipeline_file;
    bool console = true;
    bool verbose_pipeline = false;
    std::size_t preview_bytes = 160;

    void applyDefaults();
};

// Whole-service settings. Each member owns one top-level TOML table.
struct ServiceConfig
{
    ServerConfig server;
    StorageConfig storage;
    ExtractorConfig extractor;
    AnonymizerConfig anonymizer;
    LoggingConfig logging;

    ServiceConfig() { applyDefaults(); }

    void applyDefaults();

    // Registers one load handler per table. Invalid values keep their defaults
    // and are reported as Configuration warnings.
    bool registerConfigHandlers(ConfigManager& config);
};

/// 0 means no timeout
std::optional<std::chrono::milliseconds> timeoutFromSeconds(std::int64_t seconds);

const char* to_string(AnonymizerConfig::PayloadMode mode);
