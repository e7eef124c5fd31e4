#pragma once

#include "utils.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace asd::protocol {

    using namespace std::string_view_literals;

    inline constexpr auto jsonrpc_version = "2.0"sv;

    // ── Inbound ─────────────────────────────────────────────────────

    // Structurally valid request or notification. `id` holds the raw JSON text of a
    // non-null id; an absent or null id leaves it empty (notification).
    struct request {
        std::string method{};
        std::optional<glz::raw_json> id{};
        std::optional<glz::raw_json> params{};

        bool is_notification() const { return !id.has_value(); }
    };

    // Line that is not a usable request. `id` is set only when the line was a JSON
    // object carrying a non-null id, i.e. when the sender expects an answer.
    struct malformed_line {
        std::optional<glz::raw_json> id{};
        std::string reason{};
    };

    using parsed_line = std::variant<request, malformed_line>;

    parsed_line parse_line(std::string_view line);

    // ── Outbound ────────────────────────────────────────────────────

    struct error_object {
        int code{};
        std::string message{};
        struct glaze {
            using T = error_object;
            static constexpr auto value = glz::object(&T::code, &T::message);
        };
    };

    struct response {
        std::string jsonrpc{jsonrpc_version};
        std::optional<glz::raw_json> result{};
        std::optional<error_object> error{};
        glz::raw_json id{"null"};
        struct glaze {
            using T = response;
            static constexpr auto value = glz::object(&T::jsonrpc, &T::result, &T::error, &T::id);
        };

        bool is_error() const { return error.has_value(); }
    };

    // Server-initiated request (keepalive ping)
    struct outbound_request {
        std::string jsonrpc{jsonrpc_version};
        std::string id{};
        std::string method{};
        struct glaze {
            using T = outbound_request;
            static constexpr auto value = glz::object(&T::jsonrpc, &T::id, &T::method);
        };
    };

    constexpr int to_code(glz::rpc::error_e code) noexcept {
        return static_cast<int>(code);
    }

    response make_error(const glz::raw_json& id, glz::rpc::error_e code, std::string message);

    response make_invalid_request(const glz::raw_json& id);

    template <typename T>
    response make_result(const glz::raw_json& id, const T& result) {
        response resp{};
        resp.id = id;
        glz::raw_json payload{};
        if (auto ec = glz::write_json(result, payload.str); ec) {
            return make_error(id, glz::rpc::error_e::internal, "Internal error: failed to serialize result");
        }
        resp.result = std::move(payload);
        return resp;
    }

    std::string serialize(const response& resp);
    std::string serialize(const outbound_request& req);

}  // namespace asd::protocol
