#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../pipeline/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(int level, bool append_logs)
{
    if (s_initialized)
        return true;

    if (level >= plog::none && level <= plog::verbose)
    {
        s_default_level = static_cast<plog::Severity>(level);
    }
    else
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Invalid logging level, using info",
                                     "level=" + std::to_string(level));
        s_default_level = plog::info;
    }
    s_append_logs = append_logs;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        PrepareLogDirectory(config.filepath);

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<pipeline::Diagnostics::kLogInstance>(const LoggerConfig&);

void LogManager::Shutdown()
{
    // The static plog loggers still point at s_appenders, so they are silenced rather than freed
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<pipeline::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
    }
}

} // namespace utils
