#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace asd::profile {

    struct validation_result {
        bool valid{false};
        std::string message{};
        std::size_t descriptors{};
        std::size_t links{};
    };

    struct render_result {
        bool success{false};
        std::string document{};
        std::string error{};
    };

    struct load_result {
        bool ok{false};
        std::string content{};
        std::string error{};
    };

    // Boundary to the profile-processing domain. Implementations report failures
    // through the result structs; the dispatcher also tolerates thrown exceptions.
    class profile_service {
      public:
        virtual ~profile_service() = default;

        virtual validation_result validate(std::string_view content) const = 0;
        virtual render_result render(std::string_view content, bool use_title) const = 0;
        virtual std::string guide() const = 0;
        virtual load_result load(const std::filesystem::path& path) const = 0;
    };

    // ALPS JSON profiles: structural validation, transition counting and DOT output.
    class alps_service final : public profile_service {
      public:
        validation_result validate(std::string_view content) const override;
        render_result render(std::string_view content, bool use_title) const override;
        std::string guide() const override;
        load_result load(const std::filesystem::path& path) const override;
    };

    std::string_view alps_guide();

}  // namespace asd::profile
