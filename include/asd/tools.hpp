#pragma once

#include <glaze/glaze.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace asd::tools {

    using namespace std::string_view_literals;

    inline constexpr auto validate_tool = "validate_alps"sv;
    inline constexpr auto alps2dot_tool = "alps2dot"sv;
    inline constexpr auto guide_tool = "alps_guide"sv;

    struct tool_descriptor {
        std::string_view name{};
        std::string_view description{};
        std::string_view input_schema{};
    };

    // Catalog in the order tools/list reports it
    std::span<const tool_descriptor> registry();

    const tool_descriptor* find_tool(std::string_view name);

    // ── Wire shapes ─────────────────────────────────────────────────

    struct tool_definition {
        std::string name{};
        std::string description{};
        glz::raw_json inputSchema{};
        struct glaze {
            using T = tool_definition;
            static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
        };
    };

    struct tools_list_result {
        std::vector<tool_definition> tools{};
        struct glaze {
            using T = tools_list_result;
            static constexpr auto value = glz::object(&T::tools);
        };
    };

    tools_list_result list_tools();

    struct text_content {
        std::string type{"text"};
        std::string text{};
        struct glaze {
            using T = text_content;
            static constexpr auto value = glz::object(&T::type, &T::text);
        };
    };

    struct tool_result {
        std::vector<text_content> content{};
        bool isError{false};
        struct glaze {
            using T = tool_result;
            static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
        };

        std::string_view text() const { return content.empty() ? std::string_view{} : content.front().text; }
    };

    tool_result success_result(std::string text);
    tool_result error_result(std::string text);

}  // namespace asd::tools
