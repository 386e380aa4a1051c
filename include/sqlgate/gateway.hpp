#pragma once

#include "policy.hpp"
#include "store.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlgate {

    enum class error_kind : uint8_t {
        unsupported_operation,
        policy_violation,
        execution_error,
        not_found,
        invalid_request,
        bootstrap_failure,
    };

    inline constexpr std::string_view to_string(error_kind kind) {
        switch (kind) {
            case error_kind::unsupported_operation:
                return "unsupported_operation"sv;
            case error_kind::policy_violation:
                return "policy_violation"sv;
            case error_kind::execution_error:
                return "execution_error"sv;
            case error_kind::not_found:
                return "not_found"sv;
            case error_kind::invalid_request:
                return "invalid_request"sv;
            default:
            [[unlikely]]
            case error_kind::bootstrap_failure:
                return "bootstrap_failure"sv;
        }
    }

    struct query_error {
        error_kind kind{error_kind::execution_error};
        std::string message{};
        std::optional<std::string> query{};
    };

    struct query_params {
        std::vector<value> positional{};
        std::vector<std::pair<std::string, value>> named{};

        bool empty() const { return positional.empty() && named.empty(); }
    };

    struct query_result {
        std::vector<std::string> columns{};
        std::vector<row> rows{};
        std::optional<query_error> error{};

        bool ok() const { return !error.has_value(); }
    };

    struct column_info {
        std::string name{};
        std::string type{};
        bool nullable{true};
        std::optional<std::string> default_value{};
        bool primary_key{false};
    };

    struct foreign_key_info {
        std::string column{};
        std::string references_table{};
        // null when the key targets the referenced table's primary key implicitly
        std::optional<std::string> references_column{};
    };

    struct table_schema {
        std::string name{};
        std::vector<column_info> columns{};
        std::vector<foreign_key_info> foreign_keys{};
    };

    struct schema_result {
        std::vector<table_schema> tables{};
        std::optional<query_error> error{};

        bool ok() const { return !error.has_value(); }
    };

    struct table_list_result {
        std::vector<std::string> names{};
        std::optional<query_error> error{};

        bool ok() const { return !error.has_value(); }
    };

    struct gateway_options {
        std::filesystem::path db_path{};
        policy_options policy{};
        int busy_timeout_ms{5'000};
        std::int64_t sample_limit{10};
    };

    /*
     * Read-only query gateway over one SQLite file.
     *
     * Every call opens its own read-only connection and closes it before
     * returning, so a single instance may be shared across threads. Engine
     * failures come back as typed results; nothing thrown by the store layer
     * escapes these members.
     */
    class query_gateway {
      public:
        explicit query_gateway(gateway_options opts);

        const gateway_options& options() const { return opts_; }

        policy_decision check(std::string_view text) const;

        query_result execute(std::string_view text, const query_params& params = {}) const;

        // SELECT * FROM <table> LIMIT <limit>, routed through execute()
        query_result sample(std::string_view table, std::optional<std::int64_t> limit = std::nullopt) const;

        table_list_result list_tables() const;
        schema_result describe_table(std::string_view table) const;
        schema_result describe_all() const;

      private:
        gateway_options opts_;
    };

}  // namespace sqlgate

namespace std {
    template <>
    struct formatter<sqlgate::error_kind, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const sqlgate::error_kind& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(sqlgate::to_string(val), ctx);
        }
    };

    template <>
    struct formatter<sqlgate::value_kind, char> : formatter<std::string_view> {
        template <typename FormatContext>
        auto format(const sqlgate::value_kind& val, FormatContext& ctx) const {
            return formatter<std::string_view>::format(sqlgate::to_string(val), ctx);
        }
    };
}  // namespace std
