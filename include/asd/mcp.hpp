#pragma once

#include "config.hpp"
#include "dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <string>
#include <string_view>

namespace asd::mcp {

    enum class step_status {
        handled,    // one inbound line processed
        keepalive,  // wait timed out, ping sent
        pending,    // nothing to do yet (partial line, blank line, spurious wakeup)
        closed,     // end of input
        failed,     // wait/read/write failure
    };

    // Longest keepalive interval poll(2) can express
    inline constexpr std::chrono::milliseconds max_keepalive_interval{std::numeric_limits<int>::max()};

    // Longer lines are dropped unanswered, like any line that cannot be parsed
    inline constexpr std::size_t max_line_bytes = 1U << 20;

    // poll(2) timeout for a keepalive interval, clamped to [1, INT_MAX] ms
    constexpr int poll_timeout(std::chrono::milliseconds interval) noexcept {
        return static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(
                interval.count(), 1, max_keepalive_interval.count()));
    }

    // Line-oriented JSON-RPC loop over a readable descriptor and an output stream.
    // Owns the input descriptor's non-blocking mode for its lifetime; the
    // descriptor's original flags are restored on destruction.
    class transport {
      public:
        transport(
                int input,
                std::ostream& output,
                const dispatcher& handler,
                std::chrono::milliseconds interval = std::chrono::seconds{30},
                std::size_t max_line = max_line_bytes);

        transport(const transport&) = delete;
        transport& operator=(const transport&) = delete;

        ~transport();

        bool start(std::string& error);

        // One loop iteration: handle a buffered line, or wait for input up to the
        // keepalive interval and react to what the wait reports.
        step_status step();

        // Loops until end of input (0) or a transport failure (1).
        int run();

        std::uint64_t keepalive_count() const { return keepalive_counter; }

      private:
        bool take_line(std::string& line);
        step_status handle_line(std::string_view line);
        step_status read_available();
        bool send_keepalive();
        bool send(const std::string& json);

        int in_fd{-1};
        std::ostream& out;
        const dispatcher& dispatch;
        std::chrono::milliseconds keepalive_interval{};
        std::size_t line_limit{max_line_bytes};

        std::string read_buf{};
        std::uint64_t keepalive_counter{0};
        bool input_closed{false};
        bool discarding_line{false};  // inside an oversized line, skip to its newline

        int original_flags{-1};
    };

    int run_mcp_server(const startup_config& cfg);

}  // namespace asd::mcp
