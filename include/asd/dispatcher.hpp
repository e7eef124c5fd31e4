#pragma once

#include "methods.hpp"
#include "profile.hpp"
#include "protocol.hpp"
#include "tools.hpp"

#include <optional>
#include <string_view>

namespace asd {

    class dispatcher {
      public:
        explicit dispatcher(const profile::profile_service& service);

        // Response owed for `req`, or nullopt for notifications.
        std::optional<protocol::response> dispatch(const protocol::request& req) const;

        std::optional<protocol::response> dispatch(
                const methods::method_call& call, const std::optional<glz::raw_json>& id) const;

        // Runs one tool; failures of any kind come back as isError results.
        tools::tool_result call_tool(std::string_view name, const std::optional<glz::raw_json>& arguments) const;

      private:
        const profile::profile_service& service_;
    };

}  // namespace asd
