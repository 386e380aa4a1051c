#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace sqlgate {

    using namespace std::string_view_literals;

    struct blob {
        std::vector<std::uint8_t> bytes{};

        bool operator==(const blob&) const = default;
    };

    // Scalar cell value, kept in the store's native storage class.
    using value = std::variant<std::nullptr_t, std::int64_t, double, std::string, blob>;

    enum class value_kind : uint8_t { null, integer, real, text, blob };

    inline constexpr value_kind kind_of(const value& v) {
        return static_cast<value_kind>(v.index());
    }

    inline constexpr std::string_view to_string(value_kind kind) {
        switch (kind) {
            case value_kind::null:
                return "null"sv;
            case value_kind::integer:
                return "integer"sv;
            case value_kind::real:
                return "real"sv;
            case value_kind::text:
                return "text"sv;
            case value_kind::blob:
                return "blob"sv;
        }
        return "null"sv;
    }

    // Human-readable rendering: NULL, numbers, raw text, blobs as x'..'
    std::string display_value(const value& v);

    struct row_field {
        std::string column{};
        value data{};

        bool operator==(const row_field&) const = default;
    };

    /*
     * One result record: column name -> value, in the statement's column order.
     *
     * Column names are unique within a row. When a statement produces the same
     * name twice, the field keeps the position of the first occurrence and the
     * value of the last one.
     */
    class row {
      public:
        void set(std::string_view column, value v);
        const value* find(std::string_view column) const;

        const std::vector<row_field>& fields() const { return fields_; }
        std::size_t size() const { return fields_.size(); }
        bool empty() const { return fields_.empty(); }

        bool operator==(const row&) const = default;

      private:
        std::vector<row_field> fields_{};
    };

    class store_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    enum class open_mode : uint8_t { read_only, read_write_create };

    class statement {
      public:
        statement() = default;
        explicit statement(sqlite3_stmt* stmt);
        ~statement();

        statement(const statement&) = delete;
        statement& operator=(const statement&) = delete;
        statement(statement&& other) noexcept;
        statement& operator=(statement&& other) noexcept;

        explicit operator bool() const { return stmt_ != nullptr; }

        bool read_only() const;
        int parameter_count() const;
        // 0 when the statement has no parameter by that name
        int parameter_index(std::string_view name) const;
        // empty for anonymous `?` parameters
        std::string parameter_name(int index) const;
        void bind(int index, const value& v);

        // true while a row is available, false once the statement is done
        bool step();

        int column_count() const;
        std::string column_name(int index) const;
        value column_value(int index) const;

      private:
        void check(int rc, std::string_view what) const;

        sqlite3_stmt* stmt_{nullptr};
    };

    /*
     * RAII wrapper around a single sqlite3 connection. Open and prepare
     * failures throw store_error carrying the engine message.
     */
    class store_connection {
      public:
        store_connection(const std::filesystem::path& path, open_mode mode, int busy_timeout_ms);
        ~store_connection();

        store_connection(const store_connection&) = delete;
        store_connection& operator=(const store_connection&) = delete;

        // Runs one or more statements without results (scripts, pragmas).
        void exec(const std::string& sql);

        // Prepares the first statement of `sql`; `tail` receives the unparsed rest.
        // An empty statement (whitespace or comments only) yields an empty handle.
        statement prepare(std::string_view sql, std::string_view* tail = nullptr);

      private:
        sqlite3* db_{nullptr};
    };

}  // namespace sqlgate
