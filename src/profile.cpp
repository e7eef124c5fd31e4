#include "asd/profile.hpp"

#include "internal/alps.hpp"
#include "internal/guide.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>

using namespace asd::literals;
namespace fs = std::filesystem;

namespace asd::profile {

    namespace internal {

        namespace detail {

            static std::optional<std::string_view> local_fragment(std::string_view ref) {
                if (!ref.starts_with('#') || ref.size() < 2U) {
                    return std::nullopt;
                }
                return ref.substr(1U);
            }

            class profile_builder {
              public:
                explicit profile_builder(const alps_body& body) : body_(body) { model_.title = body.title.value_or(""); }

                parse_outcome build() {
                    if (!collect(body_.descriptor, "alps"sv) || !resolve(body_.descriptor) ||
                        !link_states(body_.descriptor)) {
                        return {.error = std::move(error_)};
                    }
                    return {.model = std::move(model_)};
                }

              private:
                bool fail(std::string message) {
                    error_ = std::move(message);
                    return false;
                }

                // pass 1: register every descriptor definition, depth first in document order
                bool collect(const std::vector<alps_descriptor>& descriptors, std::string_view parent) {
                    for (const auto& d : descriptors) {
                        if (!d.id && !d.href) {
                            return fail("Descriptor without id or href in '{}'"_format(parent));
                        }

                        if (d.id) {
                            if (d.id->empty()) {
                                return fail("Descriptor with empty id in '{}'"_format(parent));
                            }
                            if (index_.contains(*d.id)) {
                                return fail("Duplicate descriptor id: {}"_format(*d.id));
                            }

                            descriptor_info info{.id = *d.id, .title = d.title.value_or("")};
                            if (d.type && !try_parse_descriptor_type(*d.type, info.type)) {
                                return fail(
                                        "Invalid descriptor type '{}' for '{}' (expected semantic|safe|unsafe|idempotent)"_format(
                                                *d.type, *d.id));
                            }

                            index_.emplace(info.id, model_.descriptors.size());
                            model_.descriptors.push_back(std::move(info));
                        }

                        if (!collect(d.descriptor, d.id ? std::string_view{*d.id} : std::string_view{*d.href})) {
                            return false;
                        }
                    }
                    return true;
                }

                // pass 2: every local reference must point at a registered descriptor
                bool resolve(const std::vector<alps_descriptor>& descriptors) {
                    for (const auto& d : descriptors) {
                        if (d.href) {
                            if (auto target = local_fragment(*d.href); target && !index_.contains(std::string{*target})) {
                                return fail("Descriptor not found: {}"_format(*d.href));
                            }
                        }

                        if (d.id) {
                            auto& info = model_.descriptors[index_.at(*d.id)];
                            if (is_transition(info.type)) {
                                if (!d.rt || d.rt->empty()) {
                                    return fail("Missing rt for {} transition: {}"_format(to_string(info.type), info.id));
                                }
                                auto target = local_fragment(*d.rt);
                                if (!target) {
                                    return fail("rt must reference a local descriptor (#id) in '{}': {}"_format(
                                            info.id, *d.rt));
                                }
                                if (!index_.contains(std::string{*target})) {
                                    return fail("rt target not found in '{}': {}"_format(info.id, *d.rt));
                                }
                                info.rt = std::string{*target};
                            }
                        }

                        if (!resolve(d.descriptor)) {
                            return false;
                        }
                    }
                    return true;
                }

                const descriptor_info* transition_of(const alps_descriptor& child) const {
                    std::optional<std::string_view> id{};
                    if (child.id) {
                        id = *child.id;
                    }
                    else if (child.href) {
                        id = local_fragment(*child.href);
                    }
                    if (!id) {
                        return nullptr;
                    }
                    const auto& info = model_.descriptors[index_.at(std::string{*id})];
                    return is_transition(info.type) ? &info : nullptr;
                }

                // pass 3: a descriptor holding a transition is a state linked to the transition's rt
                bool link_states(const std::vector<alps_descriptor>& descriptors) {
                    for (const auto& d : descriptors) {
                        if (d.id) {
                            for (const auto& child : d.descriptor) {
                                if (const auto* transition = transition_of(child)) {
                                    model_.links.push_back(
                                            transition_link{.from = *d.id, .to = transition->rt, .transition = transition->id});
                                }
                            }
                        }
                        if (!link_states(d.descriptor)) {
                            return false;
                        }
                    }
                    return true;
                }

                const alps_body& body_;
                profile_model model_{};
                std::unordered_map<std::string, std::size_t> index_{};
                std::string error_{};
            };

        }  // namespace detail

        const descriptor_info* profile_model::find(std::string_view id) const {
            for (const auto& d : descriptors) {
                if (d.id == id) {
                    return &d;
                }
            }
            return nullptr;
        }

        parse_outcome parse_profile(std::string_view content) {
            auto first = utils::leading_char(content);
            if (first == '\0') {
                return {.error = "Empty ALPS profile"};
            }
            if (first == '<') {
                return {.error = "XML profiles are not supported; supply the profile as ALPS JSON"};
            }

            std::string buffer{content};
            alps_document document{};
            if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(document, buffer); ec) {
                return {.error = "Invalid JSON: {}"_format(glz::format_error(ec, buffer))};
            }
            if (!document.alps) {
                return {.error = "Missing 'alps' root element"};
            }

            return detail::profile_builder{*document.alps}.build();
        }

    }  // namespace internal

    validation_result alps_service::validate(std::string_view content) const {
        auto parsed = internal::parse_profile(content);
        if (!parsed.model) {
            return {.valid = false, .message = std::move(parsed.error)};
        }
        return {.valid = true,
                .message = "ALPS profile is valid",
                .descriptors = parsed.model->descriptors.size(),
                .links = parsed.model->links.size()};
    }

    render_result alps_service::render(std::string_view content, bool use_title) const {
        auto parsed = internal::parse_profile(content);
        if (!parsed.model) {
            return {.success = false, .error = std::move(parsed.error)};
        }
        return {.success = true, .document = internal::render_dot(*parsed.model, use_title)};
    }

    std::string alps_service::guide() const {
        return std::string{alps_guide()};
    }

    load_result alps_service::load(const fs::path& path) const {
        std::error_code ec{};
        if (!fs::is_regular_file(path, ec)) {
            return {.ok = false, .error = "File not found: {}"_format(path.string())};
        }

        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return {.ok = false, .error = "Cannot read file: {}"_format(path.string())};
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            return {.ok = false, .error = "Cannot read file: {}"_format(path.string())};
        }
        return {.ok = true, .content = ss.str()};
    }

    std::string_view alps_guide() {
        return internal::guide_text;
    }

}  // namespace asd::profile
