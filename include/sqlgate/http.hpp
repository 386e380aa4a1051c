#pragma once

#include "config.hpp"
#include "gateway.hpp"

#include <string>
#include <string_view>

namespace sqlgate::http {

    inline constexpr auto query_tool_name = "query_sql"sv;
    inline constexpr auto manifest_path = "/.well-known/mcp-schema.json"sv;
    inline constexpr auto invoke_path = "/invoke"sv;

    struct response {
        int status{200};
        std::string body{};
    };

    // Static tool manifest published at `manifest_path`.
    std::string_view manifest_json();

    response handle_root();
    response handle_health(const query_gateway& gateway);

    /*
     * Tool-call envelope: {"tool":"query_sql","input":{"query":"..."}}
     *
     *   200  {"tool":"query_sql","output":{"result":[...]}}
     *   400  invalid_request (malformed body, missing or mis-typed fields)
     *   400  unsupported_operation (any other tool)
     *   403  policy_violation
     *   500  execution_error
     *
     * Errors carry {"error":{"kind":...,"message":...,"query":...}}.
     */
    response handle_invoke(const query_gateway& gateway, std::string_view body);

    int run_http_server(const startup_config& cfg, const query_gateway& gateway);

}  // namespace sqlgate::http
