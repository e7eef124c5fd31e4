#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>

namespace asd {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << "[asd " << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace detail {
        template <size_t N>
        struct string_literal {
            std::array<char, N> str;

            consteval string_literal(const char (&s)[N]) { std::ranges::copy(s, s + N, str.begin()); }
            constexpr std::string_view sv() const { return {str.data(), N - 1}; }
        };

        template <string_literal Format>
        struct format_wrapper {
            consteval format_wrapper() = default;

            template <typename... T>
            constexpr auto operator()(T&&... args) && {
                return std::format(Format.sv(), std::forward<T>(args)...);
            }
        };
    }  // namespace detail

    namespace literals {
        template <detail::string_literal Format>
        inline consteval auto operator""_format() {
            return detail::format_wrapper<Format>{};
        }
    }  // namespace literals

    namespace utils {
        inline constexpr std::string_view whitespace_chars = " \t\r\n\f\v";

        constexpr std::string_view trim_view(std::string_view value) noexcept {
            auto first = value.find_first_not_of(whitespace_chars);
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(whitespace_chars);
            return value.substr(first, (last - first) + 1U);
        }

        // first non-blank character, or '\0' for blank input
        constexpr char leading_char(std::string_view value) noexcept {
            auto trimmed = trim_view(value);
            return trimmed.empty() ? '\0' : trimmed.front();
        }

    }  // namespace utils

}  // namespace asd
