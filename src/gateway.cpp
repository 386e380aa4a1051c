#include "sqlgate/gateway.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/utils.hpp"

#include <algorithm>
#include <utility>

using namespace sqlgate::literals;

namespace sqlgate {

    namespace detail {

        static constexpr auto single_statement_message = "You can only execute one statement at a time."sv;

        static constexpr auto list_tables_sql = "SELECT name FROM sqlite_master WHERE type = 'table'"sv;
        static constexpr auto table_exists_sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1"sv;
        static constexpr auto table_columns_sql =
                R"(SELECT name, type, "notnull", dflt_value, pk FROM pragma_table_info(?1) ORDER BY cid)"sv;
        static constexpr auto table_foreign_keys_sql =
                R"(SELECT "from", "table", "to" FROM pragma_foreign_key_list(?1) ORDER BY id, seq)"sv;

        static query_error make_error(error_kind kind, std::string message, std::optional<std::string_view> query) {
            query_error err{.kind = kind, .message = std::move(message)};
            if (query) {
                err.query = std::string{*query};
            }
            return err;
        }

        static query_result failed_query(error_kind kind, std::string message, std::optional<std::string_view> query) {
            query_result result{};
            result.error = make_error(kind, std::move(message), query);
            return result;
        }

        // true when anything but whitespace, comments or empty statements follows
        static bool has_trailing_statement(store_connection& conn, std::string_view tail) {
            while (!utils::trim_view(tail).empty()) {
                std::string_view rest{};
                try {
                    auto next = conn.prepare(tail, &rest);
                    if (next) {
                        return true;
                    }
                } catch (const store_error&) {
                    return true;
                }
                if (rest.size() >= tail.size()) {
                    break;
                }
                tail = rest;
            }
            return false;
        }

        static std::optional<std::string> bind_params(statement& stmt, const query_params& params) {
            auto expected = stmt.parameter_count();

            if (!params.positional.empty() && !params.named.empty()) {
                return std::string{"positional and named parameters cannot be mixed"};
            }

            if (params.named.empty()) {
                auto supplied = static_cast<int>(params.positional.size());
                if (supplied != expected) {
                    return "Incorrect number of bindings supplied. The current statement uses {}, and there are {} supplied."_format(
                            expected, supplied);
                }
                for (int i = 0; i < supplied; ++i) {
                    stmt.bind(i + 1, params.positional[static_cast<size_t>(i)]);
                }
                return std::nullopt;
            }

            std::vector<bool> bound(static_cast<size_t>(expected) + 1U, false);
            for (const auto& [name, v] : params.named) {
                auto idx = stmt.parameter_index(name);
                if (idx <= 0) {
                    return "unknown binding parameter: {}"_format(name);
                }
                stmt.bind(idx, v);
                bound[static_cast<size_t>(idx)] = true;
            }
            for (int i = 1; i <= expected; ++i) {
                if (!bound[static_cast<size_t>(i)]) {
                    auto name = stmt.parameter_name(i);
                    return "You did not supply a value for binding parameter {}."_format(
                            name.empty() ? "?{}"_format(i) : name);
                }
            }
            return std::nullopt;
        }

        static bool table_exists(store_connection& conn, std::string_view table) {
            auto stmt = conn.prepare(table_exists_sql);
            stmt.bind(1, std::string{table});
            return stmt.step();
        }

        static std::vector<std::string> read_table_names(store_connection& conn) {
            std::vector<std::string> names{};
            auto stmt = conn.prepare(list_tables_sql);
            while (stmt.step()) {
                names.push_back(display_value(stmt.column_value(0)));
            }
            return names;
        }

        static std::optional<std::string> optional_text(const value& v) {
            if (kind_of(v) == value_kind::null) {
                return std::nullopt;
            }
            return display_value(v);
        }

        static table_schema read_table_schema(store_connection& conn, std::string_view table) {
            table_schema schema{.name = std::string{table}};

            auto columns = conn.prepare(table_columns_sql);
            columns.bind(1, std::string{table});
            while (columns.step()) {
                auto notnull = columns.column_value(2);
                auto pk = columns.column_value(4);
                schema.columns.push_back(
                        column_info{
                                .name = display_value(columns.column_value(0)),
                                .type = display_value(columns.column_value(1)),
                                .nullable = !(kind_of(notnull) == value_kind::integer &&
                                              std::get<std::int64_t>(notnull) != 0),
                                .default_value = optional_text(columns.column_value(3)),
                                .primary_key = kind_of(pk) == value_kind::integer && std::get<std::int64_t>(pk) != 0,
                        });
            }

            auto keys = conn.prepare(table_foreign_keys_sql);
            keys.bind(1, std::string{table});
            while (keys.step()) {
                schema.foreign_keys.push_back(
                        foreign_key_info{
                                .column = display_value(keys.column_value(0)),
                                .references_table = display_value(keys.column_value(1)),
                                .references_column = optional_text(keys.column_value(2)),
                        });
            }

            return schema;
        }

    }  // namespace detail

    query_gateway::query_gateway(gateway_options opts) : opts_{std::move(opts)} {}

    policy_decision query_gateway::check(std::string_view text) const {
        return evaluate_policy(text, opts_.policy);
    }

    query_result query_gateway::execute(std::string_view text, const query_params& params) const {
        auto decision = check(text);
        if (!decision) {
            debug_log("policy denied: ", text);
            return detail::failed_query(error_kind::policy_violation, std::move(decision.reason), text);
        }

        try {
            store_connection conn{opts_.db_path, open_mode::read_only, opts_.busy_timeout_ms};

            std::string_view tail{};
            auto stmt = conn.prepare(text, &tail);
            if (!stmt) {
                return {};
            }
            if (detail::has_trailing_statement(conn, tail)) {
                return detail::failed_query(
                        error_kind::execution_error, std::string{detail::single_statement_message}, text);
            }
            if (!stmt.read_only()) {
                return detail::failed_query(error_kind::policy_violation, "statement is not read-only", text);
            }
            if (auto bind_error = detail::bind_params(stmt, params)) {
                return detail::failed_query(error_kind::execution_error, std::move(*bind_error), text);
            }

            query_result result{};
            auto column_count = stmt.column_count();
            result.columns.reserve(static_cast<size_t>(column_count));
            for (int i = 0; i < column_count; ++i) {
                result.columns.push_back(stmt.column_name(i));
            }

            while (stmt.step()) {
                row r{};
                for (int i = 0; i < column_count; ++i) {
                    r.set(result.columns[static_cast<size_t>(i)], stmt.column_value(i));
                }
                result.rows.push_back(std::move(r));
            }
            return result;
        } catch (const store_error& e) {
            return detail::failed_query(error_kind::execution_error, e.what(), text);
        }
    }

    query_result query_gateway::sample(std::string_view table, std::optional<std::int64_t> limit) const {
        auto n = limit.value_or(opts_.sample_limit);
        if (table.empty()) {
            return detail::failed_query(error_kind::invalid_request, "table_name is required", {});
        }
        if (n < 0) {
            return detail::failed_query(error_kind::invalid_request, "limit must be a non-negative integer", {});
        }

        auto sql = "SELECT * FROM {} LIMIT {}"_format(utils::quote_identifier(table), n);
        return execute(sql);
    }

    table_list_result query_gateway::list_tables() const {
        table_list_result result{};
        try {
            store_connection conn{opts_.db_path, open_mode::read_only, opts_.busy_timeout_ms};
            result.names = detail::read_table_names(conn);
        } catch (const store_error& e) {
            result.error = detail::make_error(error_kind::execution_error, e.what(), std::nullopt);
        }
        return result;
    }

    schema_result query_gateway::describe_table(std::string_view table) const {
        schema_result result{};
        try {
            store_connection conn{opts_.db_path, open_mode::read_only, opts_.busy_timeout_ms};
            if (!detail::table_exists(conn, table)) {
                result.error =
                        detail::make_error(error_kind::not_found, "Table '{}' not found"_format(table), std::nullopt);
                return result;
            }
            result.tables.push_back(detail::read_table_schema(conn, table));
        } catch (const store_error& e) {
            result.error = detail::make_error(error_kind::execution_error, e.what(), std::nullopt);
        }
        return result;
    }

    schema_result query_gateway::describe_all() const {
        schema_result result{};
        try {
            store_connection conn{opts_.db_path, open_mode::read_only, opts_.busy_timeout_ms};
            for (const auto& name : detail::read_table_names(conn)) {
                result.tables.push_back(detail::read_table_schema(conn, name));
            }
        } catch (const store_error& e) {
            result.error = detail::make_error(error_kind::execution_error, e.what(), std::nullopt);
        }
        return result;
    }

}  // namespace sqlgate
