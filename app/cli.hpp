#pragma once

#include "asd.hpp"

#include <optional>

namespace asd::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);
    int run_command(const startup_config& cfg);

}  // namespace asd::cli
