#include "sqlgate/http.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/json.hpp"

#include <glaze/glaze.hpp>
#include <httplib.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace sqlgate::literals;

namespace sqlgate::http {

    namespace detail {

        struct invoke_input {
            std::optional<std::string> query{};
            struct glaze {
                using T = invoke_input;
                static constexpr auto value = glz::object(&T::query);
            };
        };

        struct invoke_request {
            std::optional<std::string> tool{};
            std::optional<invoke_input> input{};
            struct glaze {
                using T = invoke_request;
                static constexpr auto value = glz::object(&T::tool, &T::input);
            };
        };

        struct invoke_output {
            glz::raw_json result{};
            struct glaze {
                using T = invoke_output;
                static constexpr auto value = glz::object(&T::result);
            };
        };

        struct invoke_response {
            std::string tool{};
            invoke_output output{};
            struct glaze {
                using T = invoke_response;
                static constexpr auto value = glz::object(&T::tool, &T::output);
            };
        };

        struct error_detail {
            std::string kind{};
            std::string message{};
            std::optional<std::string> query{};
            struct glaze {
                using T = error_detail;
                static constexpr auto value = glz::object(&T::kind, &T::message, &T::query);
            };
        };

        struct error_envelope {
            error_detail error{};
            struct glaze {
                using T = error_envelope;
                static constexpr auto value = glz::object(&T::error);
            };
        };

        struct root_body {
            std::string message{"Hello from MCP server"};
            struct glaze {
                using T = root_body;
                static constexpr auto value = glz::object(&T::message);
            };
        };

        struct health_body {
            std::string status{"ok"};
            std::string database{};
            size_t tables{};
            struct glaze {
                using T = health_body;
                static constexpr auto value = glz::object(&T::status, &T::database, &T::tables);
            };
        };

        static constexpr auto manifest = R"json({"tools":[{"name":"query_sql","description":"Run a SELECT SQL query on the dataset.","input_schema":{"type":"object","properties":{"query":{"type":"string"}},"required":["query"]},"output_schema":{"type":"object","properties":{"result":{"type":"array","items":{"type":"object"}}}}}]})json"sv;

        static constexpr auto json_mime = "application/json";

        static httplib::Server* active_server = nullptr;

        static void http_signal_handler(int) {
            if (active_server) {
                active_server->stop();
            }
        }

        static int status_for(error_kind kind) {
            switch (kind) {
                case error_kind::policy_violation:
                    return 403;
                case error_kind::execution_error:
                case error_kind::bootstrap_failure:
                    return 500;
                case error_kind::not_found:
                    return 404;
                case error_kind::unsupported_operation:
                case error_kind::invalid_request:
                    return 400;
            }
            return 500;
        }

        template <typename T>
        static response json_response(int status, const T& payload) {
            std::string out{};
            if (auto ec = glz::write_json(payload, out)) {
                throw std::runtime_error{"json write failed: {}"_format(glz::format_error(ec, out))};
            }
            return {.status = status, .body = std::move(out)};
        }

        // {"error":{"kind":...,"message":...,"query":...}}; query omitted when absent
        static response error_response(const query_error& err) {
            return json_response(
                    status_for(err.kind),
                    error_envelope{
                            .error = {.kind = std::string{to_string(err.kind)}, .message = err.message, .query = err.query}});
        }

        static response request_error(error_kind kind, std::string message) {
            return error_response(query_error{.kind = kind, .message = std::move(message)});
        }

        static void apply(httplib::Response& res, const response& r) {
            res.status = r.status;
            res.set_content(r.body, json_mime);
        }

    }  // namespace detail

    std::string_view manifest_json() {
        return detail::manifest;
    }

    response handle_root() {
        return detail::json_response(200, detail::root_body{});
    }

    response handle_health(const query_gateway& gateway) {
        auto tables = gateway.list_tables();
        if (!tables.ok()) {
            return detail::error_response(*tables.error);
        }
        return detail::json_response(
                200, detail::health_body{.database = gateway.options().db_path.string(), .tables = tables.names.size()});
    }

    response handle_invoke(const query_gateway& gateway, std::string_view body) {
        detail::invoke_request request{};
        std::string buffer{body};
        auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(request, buffer);
        if (ec) {
            return detail::request_error(
                    error_kind::invalid_request,
                    "request body must be a JSON object with string fields tool and input.query");
        }

        if (!request.tool) {
            return detail::request_error(error_kind::invalid_request, "missing required field: tool");
        }
        if (*request.tool != query_tool_name) {
            return detail::request_error(error_kind::unsupported_operation, "Unsupported tool: {}"_format(*request.tool));
        }
        if (!request.input || !request.input->query) {
            return detail::request_error(error_kind::invalid_request, "missing required field: input.query");
        }

        auto result = gateway.execute(*request.input->query);
        if (!result.ok()) {
            return detail::error_response(*result.error);
        }

        detail::invoke_response resp{};
        resp.tool = std::string{query_tool_name};
        resp.output.result = glz::raw_json{json::rows_to_json(result.rows)};

        return detail::json_response(200, resp);
    }

    int run_http_server(const startup_config& cfg, const query_gateway& gateway) {
        httplib::Server svr{};

        svr.Get("/", [](const httplib::Request&, httplib::Response& res) { detail::apply(res, handle_root()); });

        svr.Get(std::string{manifest_path}, [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string{manifest_json()}, detail::json_mime);
        });

        svr.Get("/health", [&gateway](const httplib::Request&, httplib::Response& res) {
            detail::apply(res, handle_health(gateway));
        });

        svr.Post(std::string{invoke_path}, [&gateway, &cfg](const httplib::Request& req, httplib::Response& res) {
            auto r = handle_invoke(gateway, req.body);
            if (cfg.verbose) {
                std::cerr << "POST " << invoke_path << " -> " << r.status << '\n';
            }
            detail::apply(res, r);
        });

        detail::active_server = &svr;
        auto old_int_handler = std::signal(SIGINT, detail::http_signal_handler);
        auto old_term_handler = std::signal(SIGTERM, detail::http_signal_handler);

        if (!cfg.quiet) {
            std::cerr << "sqlgate http server listening on http://" << cfg.bind_address << ':' << cfg.port << '\n';
            std::cerr << "database: " << cfg.db_path.string() << '\n';
            std::cerr << "endpoints: GET /, GET " << manifest_path << ", GET /health, POST " << invoke_path << '\n';
        }

        bool ok = svr.listen(cfg.bind_address, cfg.port);

        std::signal(SIGINT, old_int_handler);
        std::signal(SIGTERM, old_term_handler);
        detail::active_server = nullptr;

        if (!ok) {
            std::cerr << "error: failed to listen on " << cfg.bind_address << ':' << cfg.port << '\n';
            return 1;
        }
        if (!cfg.quiet) {
            std::cerr << "http server stopped\n";
        }
        return 0;
    }

}  // namespace sqlgate::http
