#include "asd/tools.hpp"

#include <algorithm>
#include <array>

namespace asd::tools {

    namespace detail {

        static constexpr auto validate_description = R"(Validate ALPS profile and check for errors)"sv;
        static constexpr auto validate_input_schema =
                R"json({"type": "object","properties": {"alps_content": {"type": "string","description": "ALPS profile content (JSON)"},"file_path": {"type": "string","description": "Path to an ALPS profile file, used when alps_content is not given"}},"anyOf": [{"required": ["alps_content"]},{"required": ["file_path"]}]})json"sv;

        static constexpr auto alps2dot_description = R"(Convert ALPS profile to DOT format for Graphviz)"sv;
        static constexpr auto alps2dot_input_schema =
                R"json({"type": "object","properties": {"alps_content": {"type": "string","description": "ALPS profile content (JSON)"},"file_path": {"type": "string","description": "Path to an ALPS profile file, used when alps_content is not given"},"use_title": {"type": "boolean","description": "Use human-readable titles instead of IDs","default": false}},"anyOf": [{"required": ["alps_content"]},{"required": ["file_path"]}]})json"sv;

        static constexpr auto guide_description = R"(Get ALPS best practices and reference guide)"sv;
        static constexpr auto guide_input_schema = R"json({"type": "object","properties": {},"required": []})json"sv;

        static constexpr std::array catalog{
                tool_descriptor{
                        .name = validate_tool,
                        .description = validate_description,
                        .input_schema = validate_input_schema},
                tool_descriptor{
                        .name = alps2dot_tool,
                        .description = alps2dot_description,
                        .input_schema = alps2dot_input_schema},
                tool_descriptor{.name = guide_tool, .description = guide_description, .input_schema = guide_input_schema},
        };

    }  // namespace detail

    std::span<const tool_descriptor> registry() {
        return detail::catalog;
    }

    const tool_descriptor* find_tool(std::string_view name) {
        auto it = std::ranges::find(detail::catalog, name, &tool_descriptor::name);
        return it == detail::catalog.end() ? nullptr : &*it;
    }

    tools_list_result list_tools() {
        tools_list_result result{};
        result.tools.reserve(detail::catalog.size());
        for (const auto& tool : detail::catalog) {
            result.tools.push_back(
                    tool_definition{
                            .name = std::string{tool.name},
                            .description = std::string{tool.description},
                            .inputSchema = glz::raw_json{tool.input_schema},
                    });
        }
        return result;
    }

    tool_result success_result(std::string text) {
        tool_result result{};
        result.content.push_back(text_content{.text = std::move(text)});
        result.isError = false;
        return result;
    }

    tool_result error_result(std::string text) {
        tool_result result{};
        result.content.push_back(text_content{.text = std::move(text)});
        result.isError = true;
        return result;
    }

}  // namespace asd::tools
