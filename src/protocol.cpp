#include "asd/protocol.hpp"

using namespace asd::literals;

namespace asd::protocol {

    namespace detail {

        // Every member is captured as raw JSON so that any object parses and the
        // structural checks below decide what is missing.
        struct envelope {
            std::optional<glz::raw_json> jsonrpc{};
            std::optional<glz::raw_json> method{};
            std::optional<glz::raw_json> id{};
            std::optional<glz::raw_json> params{};
            struct glaze {
                using T = envelope;
                static constexpr auto value = glz::object(&T::jsonrpc, &T::method, &T::id, &T::params);
            };
        };

        static std::optional<std::string> decode_string(const glz::raw_json& raw) {
            std::string value{};
            if (auto ec = glz::read_json(value, raw.str); ec) {
                return std::nullopt;
            }
            return value;
        }

        static std::string serialize_or(const auto& value, std::string_view fallback) {
            std::string json{};
            if (auto ec = glz::write_json(value, json); ec) {
                debug_log("failed to serialize outbound message: ", glz::format_error(ec, json));
                return std::string{fallback};
            }
            return json;
        }

    }  // namespace detail

    parsed_line parse_line(std::string_view line) {
        // glaze reads from null-terminated buffers
        std::string buffer{line};
        detail::envelope env{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(env, buffer); ec) {
            return malformed_line{.reason = "not a JSON object: {}"_format(glz::format_error(ec, buffer))};
        }

        if (!env.jsonrpc) {
            return malformed_line{.id = std::move(env.id), .reason = "missing jsonrpc member"};
        }
        if (auto version = detail::decode_string(*env.jsonrpc); !version || *version != jsonrpc_version) {
            return malformed_line{.id = std::move(env.id), .reason = "jsonrpc must be \"2.0\""};
        }

        if (!env.method) {
            return malformed_line{.id = std::move(env.id), .reason = "missing method member"};
        }
        auto method = detail::decode_string(*env.method);
        if (!method) {
            return malformed_line{.id = std::move(env.id), .reason = "method must be a string"};
        }

        return request{.method = std::move(*method), .id = std::move(env.id), .params = std::move(env.params)};
    }

    response make_error(const glz::raw_json& id, glz::rpc::error_e code, std::string message) {
        response resp{};
        resp.id = id;
        resp.error = error_object{.code = to_code(code), .message = std::move(message)};
        return resp;
    }

    response make_invalid_request(const glz::raw_json& id) {
        return make_error(id, glz::rpc::error_e::invalid_request, "Invalid Request");
    }

    std::string serialize(const response& resp) {
        return detail::serialize_or(
                resp,
                R"({"jsonrpc":"2.0","error":{"code":-32603,"message":"Internal error"},"id":null})"sv);
    }

    std::string serialize(const outbound_request& req) {
        return detail::serialize_or(req, R"({"jsonrpc":"2.0","method":"ping"})"sv);
    }

}  // namespace asd::protocol
