#pragma once

#include "asd.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/alps.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace asd::test {

    using namespace std::string_view_literals;

    namespace detail {
        namespace fs = std::filesystem;

        struct temp_dir {
            fs::path path{};

            explicit temp_dir(std::string_view prefix) {
                auto now = std::chrono::system_clock::now().time_since_epoch().count();
                std::ostringstream dir_name{};
                dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
                path = fs::temp_directory_path() / dir_name.str();
                fs::create_directories(path);
            }

            ~temp_dir() {
                std::error_code ec{};
                fs::remove_all(path, ec);
            }

            temp_dir(const temp_dir&) = delete;
            temp_dir& operator=(const temp_dir&) = delete;
        };

        inline void write_file(const fs::path& p, std::string_view content) {
            std::ofstream out{p};
            REQUIRE(out.good());
            out << content;
        }

        // pipe whose read end feeds a transport under test
        struct pipe_pair {
            int read_fd{-1};
            int write_fd{-1};

            pipe_pair() {
                int fds[2]{};
                REQUIRE(::pipe(fds) == 0);
                read_fd = fds[0];
                write_fd = fds[1];
            }

            ~pipe_pair() {
                close_write();
                if (read_fd >= 0)
                    ::close(read_fd);
            }

            pipe_pair(const pipe_pair&) = delete;
            pipe_pair& operator=(const pipe_pair&) = delete;

            void write(std::string_view data) {
                auto written = ::write(write_fd, data.data(), data.size());
                REQUIRE(written == static_cast<ssize_t>(data.size()));
            }

            void write_line(std::string_view line) {
                std::string msg{line};
                msg.push_back('\n');
                write(msg);
            }

            void close_write() {
                if (write_fd >= 0) {
                    ::close(write_fd);
                    write_fd = -1;
                }
            }
        };

        inline std::vector<std::string> split_lines(const std::string& text) {
            std::vector<std::string> lines{};
            std::istringstream in{text};
            std::string line{};
            while (std::getline(in, line)) {
                lines.push_back(line);
            }
            return lines;
        }

        // Records every call; replies are configurable per test.
        struct fake_profile_service final : profile::profile_service {
            mutable int validate_calls{0};
            mutable int render_calls{0};
            mutable int guide_calls{0};
            mutable int load_calls{0};

            mutable std::string last_content{};
            mutable bool last_use_title{false};

            profile::validation_result validation{
                    .valid = true, .message = "ALPS profile is valid", .descriptors = 3, .links = 1};
            profile::render_result rendering{.success = true, .document = "digraph fake {}\n"};
            profile::load_result loaded{.ok = true, .content = R"({"alps":{}})"};
            std::string guide_doc{"fake guide"};
            bool throw_on_validate{false};

            int adapter_calls() const { return validate_calls + render_calls + guide_calls + load_calls; }

            profile::validation_result validate(std::string_view content) const override {
                ++validate_calls;
                last_content = std::string{content};
                if (throw_on_validate) {
                    throw std::runtime_error{"validator exploded"};
                }
                return validation;
            }

            profile::render_result render(std::string_view content, bool use_title) const override {
                ++render_calls;
                last_content = std::string{content};
                last_use_title = use_title;
                return rendering;
            }

            std::string guide() const override {
                ++guide_calls;
                return guide_doc;
            }

            profile::load_result load(const fs::path&) const override {
                ++load_calls;
                return loaded;
            }
        };

        // Two states linked by three transitions, one of them unsafe
        inline constexpr auto blog_profile = R"({
  "alps": {
    "version": "1.0",
    "title": "Blog",
    "descriptor": [
      {"id": "articleId", "type": "semantic", "title": "Article ID"},
      {"id": "Index", "title": "Home", "descriptor": [
        {"href": "#goArticle"}
      ]},
      {"id": "Article", "title": "Article Page", "descriptor": [
        {"href": "#articleId"},
        {"href": "#goIndex"},
        {"id": "doDelete", "type": "unsafe", "rt": "#Index", "title": "Delete article"}
      ]},
      {"id": "goArticle", "type": "safe", "rt": "#Article", "title": "Open article"},
      {"id": "goIndex", "type": "safe", "rt": "#Index", "title": "Back home"}
    ]
  }
})"sv;

    }  // namespace detail

}  // namespace asd::test
