#pragma once

#include "asd/utils.hpp"

#include <glaze/glaze.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace asd::profile::internal {

    using namespace std::string_view_literals;

    enum class descriptor_type { semantic, safe, unsafe, idempotent };

    inline constexpr std::string_view to_string(descriptor_type type) {
        switch (type) {
            case descriptor_type::semantic:
                return "semantic"sv;
            case descriptor_type::safe:
                return "safe"sv;
            case descriptor_type::unsafe:
                return "unsafe"sv;
            case descriptor_type::idempotent:
                return "idempotent"sv;
        }
        return "semantic"sv;
    }

    inline constexpr bool try_parse_descriptor_type(std::string_view text, descriptor_type& out) {
        for (auto type : {descriptor_type::semantic,
                          descriptor_type::safe,
                          descriptor_type::unsafe,
                          descriptor_type::idempotent}) {
            if (text == to_string(type)) {
                out = type;
                return true;
            }
        }
        return false;
    }

    inline constexpr bool is_transition(descriptor_type type) {
        return type != descriptor_type::semantic;
    }

    // ── ALPS JSON document ──────────────────────────────────────────

    struct alps_descriptor {
        std::optional<std::string> id{};
        std::optional<std::string> href{};
        std::optional<std::string> type{};
        std::optional<std::string> rt{};
        std::optional<std::string> title{};
        std::optional<std::string> tag{};
        std::optional<glz::raw_json> doc{};
        std::vector<alps_descriptor> descriptor{};
        struct glaze {
            using T = alps_descriptor;
            static constexpr auto value = glz::object(
                    &T::id, &T::href, &T::type, &T::rt, &T::title, &T::tag, &T::doc, &T::descriptor);
        };
    };

    struct alps_link {
        std::optional<std::string> rel{};
        std::optional<std::string> href{};
        struct glaze {
            using T = alps_link;
            static constexpr auto value = glz::object(&T::rel, &T::href);
        };
    };

    struct alps_body {
        std::optional<std::string> version{};
        std::optional<std::string> title{};
        std::optional<glz::raw_json> doc{};
        std::vector<alps_link> link{};
        std::vector<alps_descriptor> descriptor{};
        struct glaze {
            using T = alps_body;
            static constexpr auto value =
                    glz::object(&T::version, &T::title, &T::doc, &T::link, &T::descriptor);
        };
    };

    struct alps_document {
        std::optional<alps_body> alps{};
        struct glaze {
            using T = alps_document;
            static constexpr auto value = glz::object(&T::alps);
        };
    };

    // ── Resolved model ──────────────────────────────────────────────

    struct descriptor_info {
        std::string id{};
        std::string title{};
        descriptor_type type{descriptor_type::semantic};
        std::string rt{};  // target id for transitions, without '#'

        std::string_view label(bool use_title) const {
            return use_title && !title.empty() ? std::string_view{title} : std::string_view{id};
        }
    };

    struct transition_link {
        std::string from{};
        std::string to{};
        std::string transition{};
    };

    struct profile_model {
        std::string title{};
        std::vector<descriptor_info> descriptors{};
        std::vector<transition_link> links{};

        const descriptor_info* find(std::string_view id) const;
    };

    struct parse_outcome {
        std::optional<profile_model> model{};
        std::string error{};
    };

    parse_outcome parse_profile(std::string_view content);

    std::string render_dot(const profile_model& model, bool use_title);

}  // namespace asd::profile::internal
