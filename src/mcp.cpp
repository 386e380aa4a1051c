#include "sqlgate/mcp.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/json.hpp"
#include "sqlgate/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace sqlgate::literals;
using namespace std::string_view_literals;

namespace sqlgate::mcp {

    namespace detail {

        // ── MCP protocol types ──────────────────────────────────────────

        struct client_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = client_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct initialize_params {
            std::string protocolVersion{};
            client_info clientInfo{};
            struct glaze {
                using T = initialize_params;
                static constexpr auto value =
                        glz::object("protocolVersion", &T::protocolVersion, "clientInfo", &T::clientInfo);
            };
        };

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct empty_object {
            struct glaze {
                using T = empty_object;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            empty_object tools{};
            empty_object resources{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools, &T::resources);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo);
            };
        };

        struct tool_definition {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_definition;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_definition> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            std::optional<glz::raw_json> arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value = glz::object(&T::content, "isError", &T::isError);
            };
        };

        struct resource_definition {
            std::string uri{};
            std::string name{};
            std::string description{};
            std::string mimeType{};
            struct glaze {
                using T = resource_definition;
                static constexpr auto value =
                        glz::object(&T::uri, &T::name, &T::description, "mimeType", &T::mimeType);
            };
        };

        struct resources_list_result {
            std::vector<resource_definition> resources{};
            struct glaze {
                using T = resources_list_result;
                static constexpr auto value = glz::object(&T::resources);
            };
        };

        struct resource_read_params {
            std::string uri{};
            struct glaze {
                using T = resource_read_params;
                static constexpr auto value = glz::object(&T::uri);
            };
        };

        struct resource_contents {
            std::string uri{};
            std::string mimeType{"application/json"};
            std::string text{};
            struct glaze {
                using T = resource_contents;
                static constexpr auto value = glz::object(&T::uri, "mimeType", &T::mimeType, &T::text);
            };
        };

        struct resource_read_result {
            std::vector<resource_contents> contents{};
            struct glaze {
                using T = resource_read_result;
                static constexpr auto value = glz::object(&T::contents);
            };
        };

        // ── Tool schemas ────────────────────────────────────────────────

        static constexpr auto execute_query_description =
                R"(Execute a SQL SELECT query on the database. Only statements starting with SELECT are accepted. Optional params bind ? placeholders (array) or :name placeholders (object).)";
        static constexpr auto execute_query_input_schema =
                R"json({"type": "object","properties": {"query": {"type": "string","description": "The SQL query to execute (SELECT only for safety)"},"params": {"type": ["array", "object"],"description": "Values for ? (array) or :name (object) placeholders"}},"required": ["query"]})json"sv;

        static constexpr auto get_table_info_description =
                R"(Get detailed information about a specific table: columns (name, type, nullability, default, primary key) and foreign keys.)";
        static constexpr auto get_table_info_input_schema =
                R"json({"type": "object","properties": {"table_name": {"type": "string","description": "Name of the table to inspect"}},"required": ["table_name"]})json"sv;

        static constexpr auto sample_data_description = R"(Get a sample of data from a table.)";
        static constexpr auto sample_data_input_schema =
                R"json({"type": "object","properties": {"table_name": {"type": "string","description": "Name of the table to sample from"},"limit": {"type": "integer","description": "Number of rows to return (default: 10)","default": 10,"minimum": 0}},"required": ["table_name"]})json"sv;

        // ── Tool argument types ─────────────────────────────────────────

        struct execute_query_args {
            std::optional<std::string> query{};
            std::optional<glz::raw_json> params{};
            struct glaze {
                using T = execute_query_args;
                static constexpr auto value = glz::object(&T::query, &T::params);
            };
        };

        struct table_info_args {
            std::optional<std::string> table_name{};
            struct glaze {
                using T = table_info_args;
                static constexpr auto value = glz::object(&T::table_name);
            };
        };

        struct sample_data_args {
            std::optional<std::string> table_name{};
            std::optional<std::int64_t> limit{};
            struct glaze {
                using T = sample_data_args;
                static constexpr auto value = glz::object(&T::table_name, &T::limit);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string make_response(const glz::rpc::id_t& id, T&& result) {
            glz::rpc::response_t<std::decay_t<T>> resp{};
            resp.id = id;
            resp.result = std::forward<T>(result);
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string make_error_response(
                const glz::rpc::id_t& id, glz::rpc::error_e code, const std::string& message) {
            glz::rpc::response_t<glz::raw_json> resp{};
            resp.id = id;
            resp.error = glz::rpc::error{code, std::nullopt, message};
            std::string json{};
            (void)glz::write_json(resp, json);
            return json;
        }

        static std::string object_or_empty(std::string_view raw) {
            return utils::trim_view(raw).empty() ? std::string{"{}"} : std::string{raw};
        }

        template <typename Args>
        static bool read_args(Args& args, std::string_view raw) {
            auto buffer = object_or_empty(raw);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(args, buffer);
            return !ec;
        }

        static tool_call_result text_result(std::string text, bool is_error) {
            tool_call_result result{};
            result.content.push_back(text_content{.text = std::move(text)});
            result.isError = is_error;
            return result;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(const glz::rpc::id_t& id, glz::raw_json_view raw_params) {
            initialize_params params{};
            auto buffer = object_or_empty(raw_params.str);
            (void)glz::read<glz::opts{.error_on_unknown_keys = false}>(params, buffer);

            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = "sqlgate", .version = std::string{version_string}};

            return make_response(id, std::move(result));
        }

        static std::string handle_tools_list(const glz::rpc::id_t& id) {
            tools_list_result result{};
            result.tools.push_back(
                    tool_definition{
                            .name = "execute_query",
                            .description = execute_query_description,
                            .inputSchema = glz::raw_json{execute_query_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "get_table_info",
                            .description = get_table_info_description,
                            .inputSchema = glz::raw_json{get_table_info_input_schema},
                    });
            result.tools.push_back(
                    tool_definition{
                            .name = "sample_data",
                            .description = sample_data_description,
                            .inputSchema = glz::raw_json{sample_data_input_schema},
                    });

            return make_response(id, std::move(result));
        }

        static std::string handle_execute_query(
                const glz::rpc::id_t& id, std::string_view raw_arguments, const query_gateway& gateway) {
            execute_query_args args{};
            if (!read_args(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse execute_query arguments");
            }
            if (!args.query) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "execute_query requires query");
            }

            std::string param_error{};
            auto params = json::parse_params(args.params ? std::string_view{args.params->str} : ""sv, param_error);
            if (!params) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, param_error);
            }

            auto result = gateway.execute(*args.query, *params);
            return make_response(id, text_result(json::execute_payload(result), !result.ok()));
        }

        static std::string handle_get_table_info(
                const glz::rpc::id_t& id, std::string_view raw_arguments, const query_gateway& gateway) {
            table_info_args args{};
            if (!read_args(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse get_table_info arguments");
            }
            if (!args.table_name) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "get_table_info requires table_name");
            }

            auto result = gateway.describe_table(*args.table_name);
            if (!result.ok()) {
                return make_response(id, text_result(json::error_payload(*result.error), true));
            }
            return make_response(id, text_result(json::to_json(result.tables.front()), false));
        }

        static std::string handle_sample_data(
                const glz::rpc::id_t& id, std::string_view raw_arguments, const query_gateway& gateway) {
            sample_data_args args{};
            if (!read_args(args, raw_arguments)) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Failed to parse sample_data arguments");
            }
            if (!args.table_name || args.table_name->empty()) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "sample_data requires table_name");
            }
            if (args.limit && *args.limit < 0) {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "sample_data limit must be non-negative");
            }

            auto result = gateway.sample(*args.table_name, args.limit);
            return make_response(id, text_result(json::execute_payload(result), !result.ok()));
        }

        static std::string handle_tools_call(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, const query_gateway& gateway) {
            tool_call_params params{};
            auto buffer = object_or_empty(raw_params.str);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, buffer);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse tool call params");
            }

            auto arguments = params.arguments ? std::string_view{params.arguments->str} : std::string_view{};
            if (params.name == "execute_query") {
                return handle_execute_query(id, arguments, gateway);
            }
            if (params.name == "get_table_info") {
                return handle_get_table_info(id, arguments, gateway);
            }
            if (params.name == "sample_data") {
                return handle_sample_data(id, arguments, gateway);
            }

            return make_error_response(id, glz::rpc::error_e::invalid_params, "Unknown tool: {}"_format(params.name));
        }

        static std::string handle_resources_list(const glz::rpc::id_t& id) {
            resources_list_result result{};
            result.resources.push_back(
                    resource_definition{
                            .uri = std::string{schema_resource_uri},
                            .name = "Database Schema",
                            .description = "Complete database schema with tables and columns",
                            .mimeType = "application/json",
                    });
            result.resources.push_back(
                    resource_definition{
                            .uri = std::string{tables_resource_uri},
                            .name = "Table List",
                            .description = "List of all tables in the database",
                            .mimeType = "application/json",
                    });
            return make_response(id, std::move(result));
        }

        static std::string handle_resources_read(
                const glz::rpc::id_t& id, glz::raw_json_view raw_params, const query_gateway& gateway) {
            resource_read_params params{};
            auto buffer = object_or_empty(raw_params.str);
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, buffer);
            if (ec) {
                return make_error_response(id, glz::rpc::error_e::invalid_params, "Failed to parse resource params");
            }

            std::string text{};
            if (params.uri == schema_resource_uri) {
                auto schema = gateway.describe_all();
                if (!schema.ok()) {
                    return make_error_response(id, glz::rpc::error_e::internal, schema.error->message);
                }
                text = json::schema_to_json(schema.tables);
            }
            else if (params.uri == tables_resource_uri) {
                auto tables = gateway.list_tables();
                if (!tables.ok()) {
                    return make_error_response(id, glz::rpc::error_e::internal, tables.error->message);
                }
                text = json::table_names_to_json(tables.names);
            }
            else {
                return make_error_response(
                        id, glz::rpc::error_e::invalid_params, "Unknown resource URI: {}"_format(params.uri));
            }

            resource_read_result result{};
            result.contents.push_back(resource_contents{.uri = params.uri, .text = std::move(text)});
            return make_response(id, std::move(result));
        }

    }  // namespace detail

    std::optional<std::string> handle_message(const query_gateway& gateway, std::string_view raw_line) {
        std::string line{raw_line};

        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, line);
        if (ec) {
            return detail::make_error_response({}, glz::rpc::error_e::parse_error, "JSON parse error");
        }

        // notifications never get a reply, whatever the method
        if (std::holds_alternative<glz::generic::null_t>(request.id)) {
            debug_log("mcp notification: ", request.method);
            return std::nullopt;
        }

        if (request.method == "initialize"sv) {
            return detail::handle_initialize(request.id, request.params);
        }
        if (request.method == "ping"sv) {
            return detail::make_response(request.id, detail::empty_object{});
        }
        if (request.method == "tools/list"sv) {
            return detail::handle_tools_list(request.id);
        }
        if (request.method == "tools/call"sv) {
            return detail::handle_tools_call(request.id, request.params, gateway);
        }
        if (request.method == "resources/list"sv) {
            return detail::handle_resources_list(request.id);
        }
        if (request.method == "resources/read"sv) {
            return detail::handle_resources_read(request.id, request.params, gateway);
        }
        return detail::make_error_response(
                request.id,
                glz::rpc::error_e::method_not_found,
                "Unknown method: {}"_format(std::string{request.method}));
    }

    int serve(const query_gateway& gateway, std::istream& in, std::ostream& out, bool verbose) {
        std::string line{};
        while (std::getline(in, line)) {
            if (utils::trim_view(line).empty()) {
                continue;
            }
            if (verbose) {
                std::cerr << "mcp <- " << line << '\n';
            }

            auto response = handle_message(gateway, line);
            if (!response) {
                continue;
            }
            out << *response << '\n';
            out.flush();
        }
        return 0;
    }

    // ── Server entry point ──────────────────────────────────────────

    int run_mcp_server(const startup_config& cfg, const query_gateway& gateway) {
        ::signal(SIGPIPE, SIG_IGN);

        if (!cfg.quiet) {
            std::cerr << "sqlgate mcp server on stdio, database: " << cfg.db_path.string() << '\n';
        }
        return serve(gateway, std::cin, std::cout, cfg.verbose);
    }

}  // namespace sqlgate::mcp
