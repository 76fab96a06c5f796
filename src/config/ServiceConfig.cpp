#include "ServiceConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>

namespace
{

void warnInvalid(const std::string& table, const std::string& key, const std::string& detail)
{
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                        "Invalid value for " + table + "." + key + ", using default", detail);
}

void readString(const toml::table& t, const char* table, const char* key, std::string& target, bool allow_empty)
{
    const auto& node = t[key];
    if (!node)
        return;
    auto v = node.value<std::string>();
    if (!v)
    {
        warnInvalid(table, key, "expected a string");
        return;
    }
    if (v->empty() && !allow_empty)
    {
        warnInvalid(table, key, "must not be empty");
        return;
    }
    target = *v;
}

void readBool(const toml::table& t, const char* table, const char* key, bool& target)
{
    const auto& node = t[key];
    if (!node)
        return;
    if (auto v = node.value<bool>())
        target = *v;
    else
        warnInvalid(table, key, "expected true or false");
}

// Accepts [min, max]; anything else keeps the current value
template<typename T>
void readInteger(const toml::table& t, const char* table, const char* key, T& target, std::int64_t min,
                 std::int64_t max)
{
    const auto& node = t[key];
    if (!node)
        return;
    auto v = node.value<std::int64_t>();
    if (!v)
    {
        warnInvalid(table, key, "expected an integer");
        return;
    }
    if (*v < min || *v > max)
    {
        warnInvalid(table, key, std::to_string(*v) + " is outside [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "]");
        return;
    }
    target = static_cast<T>(*v);
}

void readArgs(const toml::table& t, const char* table, std::vector<std::string>& target)
{
    const auto& node = t["args"];
    if (!node)
        return;
    const auto* arr = node.as_array();
    if (!arr)
    {
        warnInvalid(table, "args", "expected an array of strings");
        return;
    }

    std::vector<std::string> parsed;
    for (const auto& item : *arr)
    {
        auto v = item.value<std::string>();
        if (!v)
        {
            warnInvalid(table, "args", "expected an array of strings");
            return;
        }
        parsed.push_back(*v);
    }
    target = std::move(parsed);
}

void loadServer(const toml::table& t, ServerConfig& cfg)
{
    cfg.applyDefaults();
    readString(t, "server", "host", cfg.host, false);
    readInteger(t, "server", "port", cfg.port, 1, 65535);
    readInteger(t, "server", "thread_count", cfg.thread_count, 1, 1024);
    readInteger(t, "server", "max_upload_bytes", cfg.max_upload_bytes, 1, std::int64_t{ 1 } << 32);
    readString(t, "server", "accepted_mime_type", cfg.accepted_mime_type, false);

    std::string endpoint = cfg.endpoint;
    readString(t, "server", "endpoint", endpoint, false);
    if (endpoint.front() != '/')
        warnInvalid("server", "endpoint", "'" + endpoint + "' must start with '/'");
    else
        cfg.endpoint = endpoint;
}

void loadStorage(const toml::table& t, StorageConfig& cfg)
{
    cfg.applyDefaults();
    readString(t, "storage", "temp_dir", cfg.temp_dir, true);
}

void loadExtractor(const toml::table& t, ExtractorConfig& cfg)
{
    cfg.applyDefaults();
    readString(t, "extractor", "command", cfg.command, false);
    readArgs(t, "extractor", cfg.args);
    readInteger(t, "extractor", "timeout_seconds", cfg.timeout_seconds, 0, 24 * 3600);
}

void loadAnonymizer(const toml::table& t, AnonymizerConfig& cfg)
{
    cfg.applyDefaults();
    readBool(t, "anonymizer", "enabled", cfg.enabled);
    readString(t, "anonymizer", "command", cfg.command, false);
    readArgs(t, "anonymizer", cfg.args);
    readInteger(t, "anonymizer", "timeout_seconds", cfg.timeout_seconds, 0, 24 * 3600);

    if (const auto& node = t["payload_mode"])
    {
        auto v = node.value<std::string>();
        if (v && *v == "stdin")
            cfg.payload_mode = AnonymizerConfig::PayloadMode::Stdin;
        else if (v && *v == "argument")
            cfg.payload_mode = AnonymizerConfig::PayloadMode::Argument;
        else
            warnInvalid("anonymizer", "payload_mode", "expected \"stdin\" or \"argument\"");
    }
}

void loadLogging(const toml::table& t, LoggingConfig& cfg)
{
    cfg.applyDefaults();
    readInteger(t, "logging", "level", cfg.level, 0, 6);
    readBool(t, "logging", "append", cfg.append);
    readString(t, "logging", "file", cfg.file, false);
    readString(t, "logging", "pipeline_file", cfg.pipeline_file, false);
    readBool(t, "logging", "console", cfg.console);
    readBool(t, "logging", "verbose_pipeline", cfg.verbose_pipeline);
    readInteger(t, "logging", "preview_bytes", cfg.preview_bytes, 16, 64 * 1024);
}

} // namespace

void ServerConfig::applyDefaults()
{
    host = "0.0.0.0";
    port = 8080;
    thread_count = 8;
    max_upload_bytes = 5ull * 1024 * 1024;
    accepted_mime_type = "application/pdf";
    endpoint = "/extract-text";
}

void ExtractorConfig::applyDefaults()
{
    command = "python3";
    args = { "scripts/extract_text.py" };
    timeout_seconds = 120;
}

void AnonymizerConfig::applyDefaults()
{
    enabled = true;
    command = "python3";
    args = { "scripts/anonymize_personal_info.py" };
    payload_mode = PayloadMode::Stdin;
    timeout_seconds = 60;
}

void LoggingConfig::applyDefaults()
{
    level = 4;
    append = true;
    file = "logs/cvscrub.log";
    pipeline_file = "logs/pipeline.log";
    console = true;
    verbose_pipeline = false;
    preview_bytes = 160;
}

void ServiceConfig::applyDefaults()
{
    server.applyDefaults();
    storage.applyDefaults();
    extractor.applyDefaults();
    anonymizer.applyDefaults();
    logging.applyDefaults();
}

bool ServiceConfig::registerConfigHandlers(ConfigManager& config)
{
    bool ok = true;

    TableCallbacks server_cb;
    server_cb.load = [this](const toml::table& t) { loadServer(t, server); };
    ok &= config.registerTable("server", std::move(server_cb),
                               { "host", "port", "thread_count", "max_upload_bytes", "accepted_mime_type",
                                 "endpoint" });

    TableCallbacks storage_cb;
    storage_cb.load = [this](const toml::table& t) { loadStorage(t, storage); };
    ok &= config.registerTable("storage", std::move(storage_cb), { "temp_dir" });

    TableCallbacks extractor_cb;
    extractor_cb.load = [this](const toml::table& t) { loadExtractor(t, extractor); };
    ok &= config.registerTable("extractor", std::move(extractor_cb), { "command", "args", "timeout_seconds" });

    TableCallbacks anonymizer_cb;
    anonymizer_cb.load = [this](const toml::table& t) { loadAnonymizer(t, anonymizer); };
    ok &= config.registerTable("anonymizer", std::move(anonymizer_cb),
                               { "enabled", "command", "args", "payload_mode", "timeout_seconds" });

    TableCallbacks logging_cb;
    logging_cb.load = [this](const toml::table& t) { loadLogging(t, logging); };
    ok &= config.registerTable("logging", std::move(logging_cb),
                               { "level", "append", "file", "pipeline_file", "console", "verbose_pipeline",
                                 "preview_bytes" });

    return ok;
}

std::optional<std::chrono::milliseconds> timeoutFromSeconds(std::int64_t seconds)
{
    if (seconds <= 0)
        return std::nullopt;
    return std::chrono::milliseconds(seconds * 1000);
}

const char* to_string(AnonymizerConfig::PayloadMode mode)
{
    return mode == AnonymizerConfig::PayloadMode::Argument ? "argument" : "stdin";
}
