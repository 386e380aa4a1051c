#pragma once

#include "config.hpp"
#include "gateway.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate::mcp {

    inline constexpr auto protocol_version = "2024-11-05"sv;
    inline constexpr auto schema_resource_uri = "sqlite:///schema"sv;
    inline constexpr auto tables_resource_uri = "sqlite:///tables"sv;

    // Handles one JSON-RPC line; nullopt for notifications.
    std::optional<std::string> handle_message(const query_gateway& gateway, std::string_view line);

    // Newline-delimited JSON-RPC loop until `in` closes.
    int serve(const query_gateway& gateway, std::istream& in, std::ostream& out, bool verbose = false);

    int run_mcp_server(const startup_config& cfg, const query_gateway& gateway);

}  // namespace sqlgate::mcp
