#pragma once

#include <optional>
#include <string>
#include <vector>

struct CommandLineOptions
{
    std::string config_path = "config.toml";
    std::optional<int> port;
    bool verbose = false;
    bool show_help = false;
};

// Parses argv[1..]. Returns std::nullopt and fills `error` on an unknown flag or a bad value.
std::optional<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args, std::string& error);

std::string UsageText(const std::string& program);
