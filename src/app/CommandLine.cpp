#include "CommandLine.hpp"

#include <charconv>

namespace
{

bool parsePort(const std::string& text, int& port)
{
    int value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || value < 0 || value > 65535)
        return false;
    port = value;
    return true;
}

} // namespace

std::optional<CommandLineOptions> ParseCommandLine(const std::vector<std::string>& args, std::string& error)
{
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h")
        {
            options.show_help = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            options.verbose = true;
        }
        else if (arg == "--config" || arg == "--port")
        {
            if (i + 1 >= args.size())
            {
                error = arg + " requires a value";
                return std::nullopt;
            }
            const std::string& value = args[++i];
            if (arg == "--config")
            {
                options.config_path = value;
            }
            else
            {
                int port = 0;
                if (!parsePort(value, port))
                {
                    error = "invalid port '" + value + "'";
                    return std::nullopt;
                }
                options.port = port;
            }
        }
        else
        {
            error = "unknown argument '" + arg + "'";
            return std::nullopt;
        }
    }

    return options;
}

std::string UsageText(const std::string& program)
{
    return "Usage: " + program + " [options]\n"
           "\n"
           "Options:\n"
           "  --config <path>  TOML configuration file (default: config.toml)\n"
           "  --port <n>       Listen port, overrides [server].port (0 picks a free port)\n"
           "  --verbose        Log document previews and per-stage timings to the pipeline log\n"
           "  --help           Show this message\n";
}
