#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace asd::cli {

    namespace detail {

        static constexpr auto mcp_host_example = R"(MCP host configuration:
  {
    "mcpServers": {
      "alps": {
        "command": "/path/to/asd-cli",
        "args": ["serve"]
      }
    }
  }
)"sv;

        static constexpr auto max_keepalive_seconds = static_cast<int>(
                std::chrono::duration_cast<std::chrono::seconds>(mcp::max_keepalive_interval).count());

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "command=" << to_string(cfg.command) << '\n';
            os << "input_file=" << (cfg.input_file ? cfg.input_file->string() : "<none>") << '\n';
            os << "use_title=" << (cfg.use_title ? "true" : "false") << '\n';
            os << "keepalive_seconds="
               << std::chrono::duration_cast<std::chrono::seconds>(cfg.keepalive_interval).count() << '\n';
            os << "quiet=" << (cfg.quiet ? "true" : "false") << '\n';
            os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
        }

        static std::optional<std::string> read_input(const profile::profile_service& service, const startup_config& cfg) {
            if (!cfg.input_file) {
                std::cerr << "missing input file\n";
                return std::nullopt;
            }
            auto loaded = service.load(*cfg.input_file);
            if (!loaded.ok) {
                std::cerr << loaded.error << '\n';
                return std::nullopt;
            }
            return std::move(loaded.content);
        }

        static int run_validate(const startup_config& cfg) {
            profile::alps_service service{};
            auto content = read_input(service, cfg);
            if (!content) {
                return 1;
            }

            auto result = service.validate(*content);
            if (!result.valid) {
                std::cerr << "Invalid ALPS profile: " << result.message << '\n';
                return 1;
            }
            std::cout << "Valid ALPS profile\n";
            std::cout << "  Descriptors: " << result.descriptors << '\n';
            std::cout << "  Links: " << result.links << '\n';
            return 0;
        }

        static int run_alps2dot(const startup_config& cfg) {
            profile::alps_service service{};
            auto content = read_input(service, cfg);
            if (!content) {
                return 1;
            }

            auto result = service.render(*content, cfg.use_title);
            if (!result.success) {
                std::cerr << "Error: " << (result.error.empty() ? "Unknown error" : result.error) << '\n';
                return 1;
            }
            std::cout << result.document;
            return 0;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"asd-cli - ALPS validation and processing", std::string{server_name}};
        app.require_subcommand(0, 1);
        app.fallthrough();
        app.footer(std::string{detail::mcp_host_example});

        bool show_version = false;
        int keepalive_seconds = static_cast<int>(
                std::chrono::duration_cast<std::chrono::seconds>(cfg.keepalive_interval).count());
        std::string input_arg{};

        app.add_flag("-v,--version", show_version, "Print version and exit");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        auto* serve = app.add_subcommand("serve", "Start the MCP server on stdin/stdout");
        serve->add_option("--keepalive-seconds", keepalive_seconds, "Idle seconds before a keepalive ping")
                ->check(CLI::Range(1, detail::max_keepalive_seconds));

        auto* validate = app.add_subcommand("validate", "Validate an ALPS profile");
        validate->add_option("file", input_arg, "ALPS profile (JSON)")->required();

        auto* alps2dot = app.add_subcommand("alps2dot", "Convert an ALPS profile to DOT");
        alps2dot->add_flag("-t,--title", cfg.use_title, "Use human-readable titles instead of ids");
        alps2dot->add_option("file", input_arg, "ALPS profile (JSON)")->required();

        auto* guide = app.add_subcommand("guide", "Show the ALPS best practices guide");
        auto* version = app.add_subcommand("version", "Show version information");
        auto* help = app.add_subcommand("help", "Show this help message");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e) == 0 ? 0 : 1};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{1};
        }

        if (serve->parsed()) {
            cfg.command = command_kind::serve;
        }
        else if (validate->parsed()) {
            cfg.command = command_kind::validate;
        }
        else if (alps2dot->parsed()) {
            cfg.command = command_kind::alps2dot;
        }
        else if (guide->parsed()) {
            cfg.command = command_kind::guide;
        }
        else if (version->parsed() || show_version) {
            cfg.command = command_kind::version;
        }
        else if (help->parsed()) {
            cfg.command = command_kind::help;
        }

        if (!input_arg.empty()) {
            cfg.input_file = input_arg;
        }
        cfg.keepalive_interval = std::chrono::seconds{keepalive_seconds};

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        if (cfg.command == command_kind::help) {
            std::cout << app.help();
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run_command(const startup_config& cfg) {
        switch (cfg.command) {
            case command_kind::serve:
                return mcp::run_mcp_server(cfg);
            case command_kind::validate:
                return detail::run_validate(cfg);
            case command_kind::alps2dot:
                return detail::run_alps2dot(cfg);
            case command_kind::guide:
                std::cout << profile::alps_guide() << '\n';
                return 0;
            case command_kind::version:
                std::cout << server_name << " version " << cli_version << '\n';
                return 0;
            case command_kind::help:
                break;
        }
        return 0;
    }

}  // namespace asd::cli
