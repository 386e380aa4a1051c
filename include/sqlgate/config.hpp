#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace sqlgate {

    using namespace std::string_view_literals;

    /*
     * sqlgate Startup Config Options
     *
     * Store
     * - db_path: SQLite database file served by every transport.
     * - init_script: SQL script used to build the database when the file is missing.
     * - seed_sample: Build the bundled users/posts sample when the file is missing and no script is given.
     * - busy_timeout_ms: How long a connection waits on a locked database before failing.
     *
     * Policy
     * - allow_with: Also accept statements whose leading token is WITH (common table expressions).
     * - deny_keywords: Additionally reject statements naming a destructive keyword anywhere.
     *
     * Transports
     * - mode: repl (default), one-shot query, http, or mcp (stdio).
     * - port/bind_address: HTTP listen endpoint.
     * - sample_limit: Row count sample_data returns when the caller gives none.
     * - query: Statement executed by the one-shot query mode.
     *
     * Session and UX
     * - output_mode: Result rendering for the REPL and one-shot query ("table" or "json").
     * - color_mode: ANSI color behavior for the line editor.
     * - history_file/history_enabled: Persisted REPL history.
     * - quiet/verbose: Coarse verbosity knobs for status logs on stderr.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */

    enum class run_mode { repl, query, http, mcp };
    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    inline constexpr std::string_view to_string(run_mode mode) {
        switch (mode) {
            case run_mode::repl:
                return "repl"sv;
            case run_mode::query:
                return "query"sv;
            case run_mode::http:
                return "http"sv;
            case run_mode::mcp:
                return "mcp"sv;
        }
        return "repl"sv;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view default_db_path = "/tmp/database.db"sv;
    inline constexpr int default_port = 8000;
    inline constexpr std::int64_t default_sample_limit = 10;
    inline constexpr auto version_string = "1.0.0"sv;

    struct startup_config {
        std::filesystem::path db_path{default_db_path};
        std::optional<std::filesystem::path> init_script{};
        bool seed_sample{true};
        int busy_timeout_ms{5'000};

        bool allow_with{false};
        bool deny_keywords{false};

        run_mode mode{run_mode::repl};
        int port{default_port};
        std::string bind_address{"127.0.0.1"};
        std::int64_t sample_limit{default_sample_limit};
        std::optional<std::string> query{};

        output_mode output{output_mode::table};
        color_mode color{color_mode::automatic};
        std::filesystem::path history_file{".sqlgate_history"};
        bool history_enabled{true};
        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace sqlgate
