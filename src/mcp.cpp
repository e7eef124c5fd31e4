#include "asd/mcp.hpp"

#include "asd/profile.hpp"
#include "asd/protocol.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <variant>

using namespace asd::literals;

namespace asd::mcp {

    namespace detail {

        static constexpr auto keepalive_id_prefix = "server-ping-"sv;

        static void print_banner(const startup_config& cfg, std::ostream& os) {
            os << "Starting ASD MCP Server...\n";
            os << "Server: " << server_name << " v" << server_version << '\n';
            os << "Protocol: MCP " << mcp_protocol_version << '\n';
            if (cfg.verbose) {
                os << "Keepalive: every " << cfg.keepalive_interval.count() << "ms of idle input\n";
            }
            os << '\n';
        }

    }  // namespace detail

    transport::transport(
            int input,
            std::ostream& output,
            const dispatcher& handler,
            std::chrono::milliseconds interval,
            std::size_t max_line)
            : in_fd(input), out(output), dispatch(handler), keepalive_interval(interval), line_limit(max_line) {}

    transport::~transport() {
        if (original_flags >= 0) {
            (void)::fcntl(in_fd, F_SETFL, original_flags);
        }
    }

    bool transport::start(std::string& error) {
        if (original_flags >= 0) {
            return true;
        }
        int flags = ::fcntl(in_fd, F_GETFL);
        if (flags < 0) {
            error = "failed to read input flags: {}"_format(std::strerror(errno));
            return false;
        }
        if (::fcntl(in_fd, F_SETFL, flags | O_NONBLOCK) != 0) {
            error = "failed to make input non-blocking: {}"_format(std::strerror(errno));
            return false;
        }
        original_flags = flags;
        return true;
    }

    step_status transport::step() {
        std::string line{};
        if (take_line(line)) {
            return handle_line(line);
        }

        if (input_closed) {
            // unterminated last line
            if (!read_buf.empty() && !discarding_line) {
                line = std::move(read_buf);
                read_buf.clear();
                if (handle_line(line) == step_status::failed) {
                    return step_status::failed;
                }
            }
            return step_status::closed;
        }

        pollfd pfd{.fd = in_fd, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, poll_timeout(keepalive_interval));
        if (ret < 0) {
            if (errno == EINTR) {
                return step_status::pending;
            }
            std::cerr << server_name << ": poll failed: " << std::strerror(errno) << '\n';
            return step_status::failed;
        }
        if (ret == 0) {
            return send_keepalive() ? step_status::keepalive : step_status::failed;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            std::cerr << server_name << ": input descriptor is not open\n";
            return step_status::failed;
        }

        // POLLIN, POLLHUP and POLLERR are all settled by read()
        return read_available();
    }

    int transport::run() {
        std::string error{};
        if (!start(error)) {
            std::cerr << server_name << ": " << error << '\n';
            return 1;
        }

        for (;;) {
            switch (step()) {
                case step_status::closed:
                    debug_log("input closed after ", keepalive_counter, " keepalive ping(s)");
                    return 0;
                case step_status::failed:
                    return 1;
                case step_status::handled:
                case step_status::keepalive:
                case step_status::pending:
                    break;
            }
        }
    }

    bool transport::take_line(std::string& line) {
        for (;;) {
            auto pos = read_buf.find('\n');
            if (pos == std::string::npos) {
                return false;
            }
            if (discarding_line || pos > line_limit) {
                debug_log("dropping oversized line");
                read_buf.erase(0, pos + 1);
                discarding_line = false;
                continue;
            }
            line.assign(read_buf, 0, pos);
            read_buf.erase(0, pos + 1);
            return true;
        }
    }

    step_status transport::read_available() {
        char chunk[4096]{};
        auto n = ::read(in_fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return step_status::pending;
            }
            std::cerr << server_name << ": read failed: " << std::strerror(errno) << '\n';
            return step_status::failed;
        }
        if (n == 0) {
            input_closed = true;
            return step();
        }

        read_buf.append(chunk, static_cast<size_t>(n));
        std::string line{};
        if (take_line(line)) {
            return handle_line(line);
        }
        if (read_buf.size() > line_limit) {
            debug_log("dropping oversized line after ", read_buf.size(), " bytes");
            read_buf.clear();
            discarding_line = true;
        }
        return step_status::pending;
    }

    step_status transport::handle_line(std::string_view raw_line) {
        auto line = utils::trim_view(raw_line);
        if (line.empty()) {
            return step_status::pending;
        }

        auto parsed = protocol::parse_line(line);

        if (auto* malformed = std::get_if<protocol::malformed_line>(&parsed)) {
            debug_log("malformed message: ", malformed->reason);
            if (!malformed->id) {
                return step_status::handled;
            }
            return send(protocol::serialize(protocol::make_invalid_request(*malformed->id))) ? step_status::handled
                                                                                              : step_status::failed;
        }

        const auto& req = std::get<protocol::request>(parsed);
        auto resp = dispatch.dispatch(req);
        if (!resp) {
            return step_status::handled;
        }
        return send(protocol::serialize(*resp)) ? step_status::handled : step_status::failed;
    }

    bool transport::send_keepalive() {
        ++keepalive_counter;
        protocol::outbound_request ping{
                .id = "{}{}"_format(detail::keepalive_id_prefix, keepalive_counter), .method = "ping"};
        debug_log("idle, sending keepalive ", ping.id);
        return send(protocol::serialize(ping));
    }

    bool transport::send(const std::string& json) {
        out << json << '\n';
        out.flush();
        if (!out) {
            std::cerr << server_name << ": failed to write to output stream\n";
            return false;
        }
        return true;
    }

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        if (!cfg.quiet) {
            detail::print_banner(cfg, std::cerr);
        }

        profile::alps_service service{};
        dispatcher handler{service};
        transport loop{STDIN_FILENO, std::cout, handler, cfg.keepalive_interval};
        return loop.run();
    }

}  // namespace asd::mcp
