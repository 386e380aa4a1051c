#include "sqlgate/cli.hpp"

#include "editor.hpp"
#include "internal/table_printer.hpp"
#include "sqlgate/format.hpp"
#include "sqlgate/json.hpp"
#include "sqlgate/utils.hpp"

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace sqlgate::cli {

    using namespace sqlgate::literals;

    static constexpr auto banner = "sqlgate read-only SQL console"sv;

    namespace detail {

        static std::optional<std::string> read_env(const char* name) {
            const char* raw = std::getenv(name);
            if (raw == nullptr || *raw == '\0') {
                return std::nullopt;
            }
            return std::string{raw};
        }

        static bool valid_port(int port) { return port >= 1 && port <= 65'535; }

        static void print_help(std::ostream& os) {
            os << "commands:\n"
                  "  :help                      show this help\n"
                  "  :tables                    list tables\n"
                  "  :schema [table]            describe one table or all of them\n"
                  "  :sample <table> [limit]    show the first rows of a table\n"
                  "  :show config               print resolved config\n"
                  "  :set output=table|json     switch result rendering\n"
                  "  :quit, :q                  exit\n"
                  "SQL statements run once a line ends with ';'\n";
        }

        static void print_error(const query_error& err, std::ostream& os) {
            os << "error ({}): {}\n"_format(err.kind, err.message);
        }

        static void print_tables(const table_list_result& result, output_mode mode, std::ostream& out) {
            if (!result.ok()) {
                print_error(*result.error, std::cerr);
                return;
            }
            if (mode == output_mode::json) {
                out << json::table_names_to_json(result.names) << '\n';
                return;
            }
            if (result.names.empty()) {
                out << "no tables\n";
                return;
            }
            for (const auto& name : result.names) {
                out << "  " << name << '\n';
            }
        }

        static void print_schema(const schema_result& result, output_mode mode, std::ostream& out) {
            if (!result.ok()) {
                print_error(*result.error, std::cerr);
                return;
            }
            if (mode == output_mode::json) {
                out << json::schema_to_json(result.tables) << '\n';
                return;
            }

            for (const auto& table : result.tables) {
                out << "table " << table.name << '\n';

                internal::table_printer printer{};
                printer.set_columns({"name", "type", "nullable", "default", "pk"});
                for (const auto& col : table.columns) {
                    row r{};
                    r.set("name", col.name);
                    r.set("type", col.type);
                    r.set("nullable", std::int64_t{col.nullable ? 1 : 0});
                    if (col.default_value) {
                        r.set("default", *col.default_value);
                    }
                    else {
                        r.set("default", nullptr);
                    }
                    r.set("pk", std::int64_t{col.primary_key ? 1 : 0});
                    printer.add_row(r);
                }
                printer.print(out);

                for (const auto& fk : table.foreign_keys) {
                    out << "  foreign key {} -> {}({})\n"_format(
                            fk.column, fk.references_table, fk.references_column.value_or("<pk>"));
                }
            }
        }

        // handles one ':' command line; returns false when `line` is not a command
        static bool process_command(
                std::string_view line, startup_config& cfg, const query_gateway& gateway, bool& should_quit) {
            auto trimmed = utils::trim_view(line);
            if (!trimmed.starts_with(':')) {
                return false;
            }

            auto split = trimmed.find_first_of(utils::whitespace_chars);
            auto command = trimmed.substr(0, split);
            auto args = split == std::string_view::npos ? std::string_view{} : utils::trim_view(trimmed.substr(split));

            if (command == ":quit"sv || command == ":q"sv) {
                should_quit = true;
                return true;
            }
            if (command == ":help"sv) {
                print_help(std::cout);
                return true;
            }
            if (command == ":tables"sv) {
                print_tables(gateway.list_tables(), cfg.output, std::cout);
                return true;
            }
            if (command == ":schema"sv) {
                auto result = args.empty() ? gateway.describe_all() : gateway.describe_table(args);
                print_schema(result, cfg.output, std::cout);
                return true;
            }
            if (command == ":sample"sv) {
                if (args.empty()) {
                    std::cerr << "usage: :sample <table> [limit]\n";
                    return true;
                }
                auto table_end = args.find_first_of(utils::whitespace_chars);
                auto table = args.substr(0, table_end);
                std::optional<std::int64_t> limit{};
                if (table_end != std::string_view::npos) {
                    auto limit_text = utils::trim_view(args.substr(table_end));
                    limit = utils::parse_arithmetic<std::int64_t>(limit_text);
                    if (!limit) {
                        std::cerr << "invalid limit: " << limit_text << '\n';
                        return true;
                    }
                }
                print_result(gateway.sample(table, limit), cfg.output, std::cout, std::cerr);
                return true;
            }
            if (command == ":show"sv) {
                if (args == "config"sv) {
                    print_config(cfg, std::cout);
                }
                else {
                    std::cerr << "usage: :show config\n";
                }
                return true;
            }
            if (command == ":set"sv) {
                constexpr auto output_key = "output="sv;
                if (!args.starts_with(output_key)) {
                    std::cerr << "usage: :set output=table|json\n";
                    return true;
                }
                auto value = args.substr(output_key.size());
                if (!try_parse_output_mode(value, cfg.output)) {
                    std::cerr << "invalid output mode: " << value << " (expected table|json)\n";
                    return true;
                }
                std::cout << "output=" << to_string(cfg.output) << '\n';
                return true;
            }

            std::cerr << "unknown command: " << command << " (try :help)\n";
            return true;
        }

        static bool statement_is_complete(std::string_view pending) {
            return utils::trim_view(pending).ends_with(';');
        }

    }  // namespace detail

    bool apply_environment(startup_config& cfg, std::ostream& err) {
        if (auto path = detail::read_env("SQLGATE_DB_PATH")) {
            cfg.db_path = *path;
        }
        else if (auto fallback = detail::read_env("DATABASE_PATH")) {
            cfg.db_path = *fallback;
        }

        if (auto port_text = detail::read_env("PORT")) {
            auto port = utils::parse_arithmetic<int>(*port_text);
            if (!port || !detail::valid_port(*port)) {
                err << "invalid PORT value: " << *port_text << " (expected 1..65535)\n";
                return false;
            }
            cfg.port = *port;
        }

        if (auto bind = detail::read_env("SQLGATE_BIND")) {
            cfg.bind_address = *bind;
        }
        return true;
    }

    bootstrap_options make_bootstrap_options(const startup_config& cfg) {
        return bootstrap_options{
                .db_path = cfg.db_path,
                .init_script = cfg.init_script,
                .seed_sample = cfg.seed_sample,
                .busy_timeout_ms = cfg.busy_timeout_ms};
    }

    gateway_options make_gateway_options(const startup_config& cfg) {
        return gateway_options{
                .db_path = cfg.db_path,
                .policy = policy_options{.allow_with = cfg.allow_with, .deny_keywords = cfg.deny_keywords},
                .busy_timeout_ms = cfg.busy_timeout_ms,
                .sample_limit = cfg.sample_limit};
    }

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << ("  db_path={}\n"
               "  init_script={}\n"
               "  seed_sample={}\n"
               "  busy_timeout_ms={}\n"
               "  allow_with={}\n"
               "  deny_keywords={}\n"
               "  mode={}\n"
               "  bind={}\n"
               "  port={}\n"
               "  sample_limit={}\n"
               "  output={}\n"
               "  color={}\n"
               "  history={}\n"_format(
                       cfg.db_path.string(),
                       cfg.init_script ? cfg.init_script->string() : std::string{"<none>"},
                       cfg.seed_sample,
                       cfg.busy_timeout_ms,
                       cfg.allow_with,
                       cfg.deny_keywords,
                       to_string(cfg.mode),
                       cfg.bind_address,
                       cfg.port,
                       cfg.sample_limit,
                       to_string(cfg.output),
                       to_string(cfg.color),
                       cfg.history_enabled ? cfg.history_file.string() : std::string{"<disabled>"}));
    }

    void print_result(const query_result& result, output_mode mode, std::ostream& out, std::ostream& err) {
        if (mode == output_mode::json) {
            if (result.ok()) {
                out << json::execute_payload(result) << '\n';
            }
            else {
                err << json::error_payload(*result.error) << '\n';
            }
            return;
        }

        if (!result.ok()) {
            detail::print_error(*result.error, err);
            return;
        }

        internal::table_printer printer{};
        printer.set_columns(result.columns);
        for (const auto& r : result.rows) {
            printer.add_row(r);
        }
        printer.print(out);
    }

    int run_query(const startup_config& cfg, const query_gateway& gateway) {
        auto result = gateway.execute(cfg.query.value_or(std::string{}));
        print_result(result, cfg.output, std::cout, std::cerr);
        return result.ok() ? 0 : 1;
    }

    void run_repl(startup_config& cfg, const query_gateway& gateway) {
        std::vector<std::string> table_names{};
        if (auto tables = gateway.list_tables(); tables.ok()) {
            table_names = std::move(tables.names);
        }

        line_editor editor{cfg, std::move(table_names)};
        std::string pending{};
        bool should_quit = false;

        if (!cfg.quiet) {
            std::cout << banner << '\n';
            std::cout << "database: " << cfg.db_path.string() << '\n';
            std::cout << "type :help for commands\n";
        }

        while (!should_quit) {
            std::string_view prompt = pending.empty() ? "sqlgate> "sv : "...> "sv;
            auto next_line = editor.read_line(prompt);
            if (!next_line) {
                if (!pending.empty()) {
                    std::cerr << "warning: discarding incomplete statement at EOF\n";
                }
                std::cout << '\n';
                break;
            }
            auto line = std::move(*next_line);

            if (utils::trim_view(line).empty()) {
                continue;
            }

            editor.record_history(line);

            if (pending.empty() && detail::process_command(line, cfg, gateway, should_quit)) {
                continue;
            }

            if (!pending.empty()) {
                pending.push_back('\n');
            }
            pending += line;

            if (!detail::statement_is_complete(pending)) {
                continue;
            }

            debug_log("executing: ", pending);
            print_result(gateway.execute(pending), cfg.output, std::cout, std::cerr);
            pending.clear();
        }
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        if (!apply_environment(cfg, std::cerr)) {
            return std::optional<int>{2};
        }

        CLI::App app{"sqlgate"};

        bool show_version = false;
        bool http_flag = false;
        bool mcp_flag = false;
        bool no_seed = false;
        bool no_history = false;
        std::string db_arg{cfg.db_path.string()};
        std::string init_script_arg{};
        std::string query_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::string history_file_arg{cfg.history_file.string()};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--db", db_arg, "SQLite database file (env: SQLGATE_DB_PATH, DATABASE_PATH)");
        app.add_flag("--http", http_flag, "Serve the HTTP tool endpoint");
        app.add_flag("--mcp", mcp_flag, "Serve MCP over stdio");
        app.add_option("-q,--query", query_arg, "Run one query and exit");
        app.add_option("--port", cfg.port, "HTTP listen port (env: PORT)");
        app.add_option("--bind", cfg.bind_address, "HTTP bind address (env: SQLGATE_BIND)");
        app.add_option("--init-script", init_script_arg, "SQL script used to build a missing database");
        app.add_flag("--no-seed", no_seed, "Do not seed the sample dataset into a missing database");
        app.add_flag("--allow-with", cfg.allow_with, "Also accept statements starting with WITH");
        app.add_flag("--deny-keywords", cfg.deny_keywords, "Reject statements naming destructive keywords");
        app.add_option("--sample-limit", cfg.sample_limit, "Default row count for sample_data");
        app.add_option("--busy-timeout", cfg.busy_timeout_ms, "Busy timeout in milliseconds");
        app.add_option("--history-file", history_file_arg, "Persistent REPL history path");
        app.add_flag("--no-history", no_history, "Disable persistent REPL history");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        auto has_query = app.get_option("--query")->count() > 0U;
        if (int(http_flag) + int(mcp_flag) + int(has_query) > 1) {
            std::cerr << "--http, --mcp and --query are mutually exclusive\n";
            return std::optional<int>{2};
        }

        if (!detail::valid_port(cfg.port)) {
            std::cerr << "invalid --port value: " << cfg.port << " (expected 1..65535)\n";
            return std::optional<int>{2};
        }
        if (cfg.sample_limit < 0) {
            std::cerr << "invalid --sample-limit value: " << cfg.sample_limit << " (expected >= 0)\n";
            return std::optional<int>{2};
        }
        if (cfg.busy_timeout_ms < 0) {
            std::cerr << "invalid --busy-timeout value: " << cfg.busy_timeout_ms << " (expected >= 0)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (db_arg.empty()) {
            std::cerr << "invalid --db value: path must not be empty\n";
            return std::optional<int>{2};
        }

        cfg.db_path = db_arg;
        if (!init_script_arg.empty()) {
            cfg.init_script = std::filesystem::path{init_script_arg};
        }
        if (no_seed) {
            cfg.seed_sample = false;
        }
        cfg.history_file = history_file_arg;
        if (no_history) {
            cfg.history_enabled = false;
        }
        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }

        if (http_flag) {
            cfg.mode = run_mode::http;
        }
        else if (mcp_flag) {
            cfg.mode = run_mode::mcp;
        }
        else if (has_query) {
            if (utils::trim_view(query_arg).empty()) {
                std::cerr << "invalid --query value: query must not be empty\n";
                return std::optional<int>{2};
            }
            cfg.mode = run_mode::query;
            cfg.query = std::move(query_arg);
        }

        if (show_version) {
            std::cout << "sqlgate " << version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace sqlgate::cli
