#pragma once

#include "utils.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

namespace asd {

    using namespace std::string_view_literals;

    /*
     * asd-cli Startup Config Options
     *
     * Command selection
     * - command: Subcommand chosen on the command line (serve, validate, alps2dot, guide, version, help).
     * - input_file: Profile path consumed by the one-shot validate/alps2dot commands.
     * - use_title: Label alps2dot output with descriptor titles instead of ids.
     *
     * MCP server
     * - keepalive_interval: Idle time after which the server emits a keepalive ping.
     *
     * Output
     * - quiet/verbose: Coarse verbosity knobs for stderr diagnostics.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    inline constexpr auto server_name = "asd-cli"sv;
    inline constexpr auto server_version = "1.0.0"sv;
    inline constexpr auto cli_version = "1.0.1"sv;
    inline constexpr auto mcp_protocol_version = "2024-11-05"sv;

    enum class command_kind { help, serve, validate, alps2dot, guide, version };

    inline constexpr std::string_view to_string(command_kind kind) {
        switch (kind) {
            case command_kind::help:
                return "help"sv;
            case command_kind::serve:
                return "serve"sv;
            case command_kind::validate:
                return "validate"sv;
            case command_kind::alps2dot:
                return "alps2dot"sv;
            case command_kind::guide:
                return "guide"sv;
            case command_kind::version:
                return "version"sv;
        }
        return "help"sv;
    }

    struct startup_config {
        command_kind command{command_kind::help};
        std::optional<std::filesystem::path> input_file{};
        bool use_title{false};

        std::chrono::milliseconds keepalive_interval{30'000};

        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace asd
