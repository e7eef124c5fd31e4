#pragma once

#include "protocol.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace asd::methods {

    using namespace std::string_view_literals;

    // ── Typed parameter shapes ──────────────────────────────────────

    struct client_info {
        std::string name{};
        std::string version{};
        struct glaze {
            using T = client_info;
            static constexpr auto value = glz::object(&T::name, &T::version);
        };
    };

    struct initialize_params {
        std::string protocolVersion{};
        client_info clientInfo{};
        struct glaze {
            using T = initialize_params;
            static constexpr auto value =
                    glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
        };
    };

    struct tool_call_params {
        std::string name{};
        std::optional<glz::raw_json> arguments{};
        struct glaze {
            using T = tool_call_params;
            static constexpr auto value = glz::object(&T::name, &T::arguments);
        };
    };

    // ── Recognized calls ────────────────────────────────────────────

    struct initialize_call {
        initialize_params params{};
    };
    struct initialized_notification {};
    struct ping_call {};
    struct tools_list_call {};
    struct tools_call {
        tool_call_params params{};
    };
    struct resources_list_call {};
    struct prompts_list_call {};

    // known method whose params could not be decoded into its typed shape
    struct invalid_params_call {
        std::string method{};
        std::string message{};
    };

    struct unrecognized_call {
        std::string method{};
    };

    using method_call = std::variant<
            initialize_call,
            initialized_notification,
            ping_call,
            tools_list_call,
            tools_call,
            resources_list_call,
            prompts_list_call,
            invalid_params_call,
            unrecognized_call>;

    using raw_params = std::optional<glz::raw_json>;

    struct method_entry {
        std::string_view name{};
        method_call (*decode)(const raw_params& params){};
    };

    // Every method the server answers, keyed by wire name
    std::span<const method_entry> method_table();

    method_call decode_call(std::string_view method, const raw_params& params);

}  // namespace asd::methods
