#include "asd/dispatcher.hpp"

#include "asd/config.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <vector>

using namespace asd::literals;

namespace asd {

    namespace detail {

        // ── Result shapes ───────────────────────────────────────────────

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_info serverInfo{};
            server_capabilities capabilities{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion", &T::protocolVersion, "serverInfo", &T::serverInfo, "capabilities", &T::capabilities);
            };
        };

        struct empty_result {
            struct glaze {
                using T = empty_result;
                static constexpr auto value = glz::object();
            };
        };

        struct resources_list_result {
            std::vector<glz::raw_json> resources{};
            struct glaze {
                using T = resources_list_result;
                static constexpr auto value = glz::object(&T::resources);
            };
        };

        struct prompts_list_result {
            std::vector<glz::raw_json> prompts{};
            struct glaze {
                using T = prompts_list_result;
                static constexpr auto value = glz::object(&T::prompts);
            };
        };

        // ── Tool arguments ──────────────────────────────────────────────

        struct profile_args {
            std::optional<std::string> alps_content{};
            std::optional<std::string> file_path{};
            std::optional<bool> use_title{};
            struct glaze {
                using T = profile_args;
                static constexpr auto value = glz::object(&T::alps_content, &T::file_path, &T::use_title);
            };
        };

        static constexpr auto required_message = "alps_content or file_path parameter is required"sv;

        static std::optional<tools::tool_result> decode_profile_args(
                std::string_view tool, const std::optional<glz::raw_json>& arguments, profile_args& out) {
            if (!arguments) {
                return std::nullopt;
            }
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(out, arguments->str);
            if (ec) {
                return tools::error_result(
                        "Invalid arguments for {}: {}"_format(tool, glz::format_error(ec, arguments->str)));
            }
            return std::nullopt;
        }

        // Inline content wins over file_path; a failed load is reported verbatim.
        static std::optional<tools::tool_result> resolve_content(
                const profile::profile_service& service, const profile_args& args, std::string& content) {
            if (args.alps_content && !args.alps_content->empty()) {
                content = *args.alps_content;
                return std::nullopt;
            }
            if (args.file_path && !args.file_path->empty()) {
                auto loaded = service.load(*args.file_path);
                if (!loaded.ok) {
                    return tools::error_result(std::move(loaded.error));
                }
                content = std::move(loaded.content);
                return std::nullopt;
            }
            return tools::error_result(std::string{required_message});
        }

        static std::string or_unknown(std::string message) {
            return message.empty() ? std::string{"Unknown error"} : message;
        }

        // ── Tool handlers ───────────────────────────────────────────────

        static tools::tool_result handle_validate(
                const profile::profile_service& service, const std::optional<glz::raw_json>& arguments) {
            profile_args args{};
            if (auto err = decode_profile_args(tools::validate_tool, arguments, args)) {
                return std::move(*err);
            }
            std::string content{};
            if (auto err = resolve_content(service, args, content)) {
                return std::move(*err);
            }

            auto result = service.validate(content);
            if (!result.valid) {
                return tools::error_result(or_unknown(std::move(result.message)));
            }
            return tools::success_result(
                    "Valid ALPS profile\nDescriptors: {}\nLinks: {}"_format(result.descriptors, result.links));
        }

        static tools::tool_result handle_alps2dot(
                const profile::profile_service& service, const std::optional<glz::raw_json>& arguments) {
            profile_args args{};
            if (auto err = decode_profile_args(tools::alps2dot_tool, arguments, args)) {
                return std::move(*err);
            }
            std::string content{};
            if (auto err = resolve_content(service, args, content)) {
                return std::move(*err);
            }

            auto result = service.render(content, args.use_title.value_or(false));
            if (!result.success) {
                return tools::error_result(or_unknown(std::move(result.error)));
            }
            return tools::success_result(std::move(result.document));
        }

        static tools::tool_result handle_guide(
                const profile::profile_service& service, const std::optional<glz::raw_json>&) {
            return tools::success_result(service.guide());
        }

        struct tool_entry {
            std::string_view name{};
            tools::tool_result (*handler)(const profile::profile_service&, const std::optional<glz::raw_json>&){};
        };

        static constexpr std::array tool_handlers{
                tool_entry{.name = tools::validate_tool, .handler = &handle_validate},
                tool_entry{.name = tools::alps2dot_tool, .handler = &handle_alps2dot},
                tool_entry{.name = tools::guide_tool, .handler = &handle_guide},
        };

        // ── Method handlers ─────────────────────────────────────────────

        struct call_visitor {
            const dispatcher& owner;
            const glz::raw_json& id;

            protocol::response operator()(const methods::initialize_call& call) const {
                if (!call.params.clientInfo.name.empty()) {
                    debug_log(
                            "initialize from ",
                            call.params.clientInfo.name,
                            " ",
                            call.params.clientInfo.version,
                            " (protocol ",
                            call.params.protocolVersion,
                            ")");
                }
                return protocol::make_result(
                        id,
                        initialize_result{
                                .protocolVersion = std::string{mcp_protocol_version},
                                .serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}},
                        });
            }

            // notification sent with an id; answer so the id is not left pending
            protocol::response operator()(const methods::initialized_notification&) const {
                return protocol::make_result(id, empty_result{});
            }

            protocol::response operator()(const methods::ping_call&) const {
                return protocol::make_result(id, empty_result{});
            }

            protocol::response operator()(const methods::tools_list_call&) const {
                return protocol::make_result(id, tools::list_tools());
            }

            protocol::response operator()(const methods::tools_call& call) const {
                return protocol::make_result(id, owner.call_tool(call.params.name, call.params.arguments));
            }

            protocol::response operator()(const methods::resources_list_call&) const {
                return protocol::make_result(id, resources_list_result{});
            }

            protocol::response operator()(const methods::prompts_list_call&) const {
                return protocol::make_result(id, prompts_list_result{});
            }

            protocol::response operator()(const methods::invalid_params_call& call) const {
                debug_log(call.method, ": ", call.message);
                return protocol::make_error(id, glz::rpc::error_e::invalid_params, call.message);
            }

            protocol::response operator()(const methods::unrecognized_call& call) const {
                debug_log("method not found: ", call.method);
                return protocol::make_error(id, glz::rpc::error_e::method_not_found, "Method not found");
            }
        };

    }  // namespace detail

    dispatcher::dispatcher(const profile::profile_service& service) : service_(service) {}

    std::optional<protocol::response> dispatcher::dispatch(const protocol::request& req) const {
        if (req.is_notification()) {
            debug_log("notification ", req.method);
            return std::nullopt;
        }
        return dispatch(methods::decode_call(req.method, req.params), req.id);
    }

    std::optional<protocol::response> dispatcher::dispatch(
            const methods::method_call& call, const std::optional<glz::raw_json>& id) const {
        if (!id) {
            return std::nullopt;
        }
        return std::visit(detail::call_visitor{.owner = *this, .id = *id}, call);
    }

    tools::tool_result dispatcher::call_tool(std::string_view name, const std::optional<glz::raw_json>& arguments) const {
        auto it = std::ranges::find(detail::tool_handlers, name, &detail::tool_entry::name);
        if (it == detail::tool_handlers.end()) {
            return tools::error_result("Unknown tool: {}"_format(name));
        }

        try {
            return it->handler(service_, arguments);
        } catch (const std::exception& e) {
            debug_log("tool ", name, " threw: ", e.what());
            return tools::error_result(std::string{e.what()});
        }
    }

}  // namespace asd
