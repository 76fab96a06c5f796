#include <catch2/catch_test_macros.hpp>

#include "app/CommandLine.hpp"

#include <string>
#include <vector>

TEST_CASE("Command line parsing", "[cli]") {
    std::string error;

    SECTION("No arguments gives defaults") {
        auto opts = ParseCommandLine({}, error);
        REQUIRE(opts.has_value());
        REQUIRE(opts->config_path == "config.toml");
        REQUIRE_FALSE(opts->port.has_value());
        REQUIRE_FALSE(opts->verbose);
        REQUIRE_FALSE(opts->show_help);
    }

    SECTION("All flags") {
        auto opts = ParseCommandLine({"--config", "/etc/cvscrub.toml", "--port", "9000", "--verbose"}, error);
        REQUIRE(opts.has_value());
        REQUIRE(opts->config_path == "/etc/cvscrub.toml");
        REQUIRE(opts->port == 9000);
        REQUIRE(opts->verbose);
    }

    SECTION("Help") {
        auto opts = ParseCommandLine({"-h"}, error);
        REQUIRE(opts.has_value());
        REQUIRE(opts->show_help);
        REQUIRE(UsageText("cvscrub").find("--config") != std::string::npos);
    }

    SECTION("Port out of range") {
        REQUIRE_FALSE(ParseCommandLine({"--port", "70000"}, error).has_value());
        REQUIRE(error.find("70000") != std::string::npos);
    }

    SECTION("Port is not a number") {
        REQUIRE_FALSE(ParseCommandLine({"--port", "80a"}, error).has_value());
    }

    SECTION("Missing value") {
        REQUIRE_FALSE(ParseCommandLine({"--config"}, error).has_value());
        REQUIRE(error == "--config requires a value");
    }

    SECTION("Unknown flag") {
        REQUIRE_FALSE(ParseCommandLine({"--daemon"}, error).has_value());
        REQUIRE(error.find("--daemon") != std::string::npos);
    }
}
