#include "internal/alps.hpp"

#include <sstream>
#include <unordered_set>

namespace asd::profile::internal {

    namespace detail {

        static void append_dot_escaped(std::string& out, std::string_view text) {
            for (auto c : text) {
                if (c == '\r' || c == '\n') {
                    continue;
                }
                if (c == '\\' || c == '"') {
                    out.push_back('\\');
                }
                out.push_back(c);
            }
        }

        static std::string quoted(std::string_view text) {
            std::string out{"\""};
            append_dot_escaped(out, text);
            out.push_back('"');
            return out;
        }

        static constexpr std::string_view edge_color(descriptor_type type) {
            switch (type) {
                case descriptor_type::safe:
                    return "#00A86B"sv;
                case descriptor_type::unsafe:
                    return "#FF4136"sv;
                case descriptor_type::idempotent:
                    return "#D4A000"sv;
                case descriptor_type::semantic:
                    break;
            }
            return "black"sv;
        }

    }  // namespace detail

    std::string render_dot(const profile_model& model, bool use_title) {
        std::ostringstream dot{};
        dot << "digraph application_state_diagram {\n";
        dot << "  graph [labelloc=\"t\",fontname=\"Helvetica\"";
        if (!model.title.empty()) {
            dot << ",label=" << detail::quoted(model.title);
        }
        dot << "];\n";
        dot << "  node [shape=box,style=\"bold,filled\",fillcolor=\"lightgray\",fontname=\"Helvetica\"];\n";
        dot << "  edge [fontname=\"Helvetica\",fontsize=13];\n";

        // states appear in the order the links first mention them
        std::vector<std::string_view> states{};
        std::unordered_set<std::string_view> seen{};
        for (const auto& link : model.links) {
            for (std::string_view id : {std::string_view{link.from}, std::string_view{link.to}}) {
                if (seen.insert(id).second) {
                    states.push_back(id);
                }
            }
        }

        if (!states.empty()) {
            dot << '\n';
        }
        for (auto id : states) {
            const auto* state = model.find(id);
            auto label = state ? state->label(use_title) : id;
            dot << "  " << detail::quoted(id) << " [label=" << detail::quoted(label) << "];\n";
        }

        if (!model.links.empty()) {
            dot << '\n';
        }
        for (const auto& link : model.links) {
            const auto* transition = model.find(link.transition);
            if (transition == nullptr) {
                continue;
            }

            std::string label{transition->label(use_title)};
            label.append(" (");
            label.append(to_string(transition->type));
            label.push_back(')');

            dot << "  " << detail::quoted(link.from) << " -> " << detail::quoted(link.to)
                << " [label=" << detail::quoted(label) << ",color=\"" << detail::edge_color(transition->type)
                << "\"];\n";
        }

        dot << "}\n";
        return dot.str();
    }

}  // namespace asd::profile::internal
