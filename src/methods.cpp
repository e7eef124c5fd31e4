#include "asd/methods.hpp"

#include <algorithm>
#include <array>

using namespace asd::literals;

namespace asd::methods {

    namespace detail {

        template <typename Call>
        static method_call decode_empty(const raw_params&) {
            return Call{};
        }

        static method_call decode_initialize(const raw_params& params) {
            initialize_call call{};
            if (params) {
                // lenient: the handshake succeeds whatever the client sends
                if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(call.params, params->str); ec) {
                    debug_log("ignoring undecodable initialize params: ", glz::format_error(ec, params->str));
                    call.params = {};
                }
            }
            return call;
        }

        static method_call decode_tools_call(const raw_params& params) {
            tools_call call{};
            if (params) {
                if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(call.params, params->str); ec) {
                    return invalid_params_call{
                            .method = "tools/call",
                            .message = "Invalid params: {}"_format(glz::format_error(ec, params->str))};
                }
            }
            return call;
        }

        static constexpr std::array table{
                method_entry{.name = "initialize"sv, .decode = &decode_initialize},
                method_entry{.name = "notifications/initialized"sv, .decode = &decode_empty<initialized_notification>},
                method_entry{.name = "ping"sv, .decode = &decode_empty<ping_call>},
                method_entry{.name = "tools/list"sv, .decode = &decode_empty<tools_list_call>},
                method_entry{.name = "tools/call"sv, .decode = &decode_tools_call},
                method_entry{.name = "resources/list"sv, .decode = &decode_empty<resources_list_call>},
                method_entry{.name = "prompts/list"sv, .decode = &decode_empty<prompts_list_call>},
        };

    }  // namespace detail

    std::span<const method_entry> method_table() {
        return detail::table;
    }

    method_call decode_call(std::string_view method, const raw_params& params) {
        auto it = std::ranges::find(detail::table, method, &method_entry::name);
        if (it == detail::table.end()) {
            return unrecognized_call{.method = std::string{method}};
        }
        return it->decode(params);
    }

}  // namespace asd::methods
