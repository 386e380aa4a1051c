#include "sqlgate/store.hpp"

#include "sqlgate/format.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <limits>
#include <utility>

using namespace sqlgate::literals;

namespace sqlgate {

    namespace detail {

        static void throw_if(int rc, sqlite3* db, std::string_view what) {
            if (rc != SQLITE_OK) {
                throw store_error{"{}: {}"_format(what, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc))};
            }
        }

        static constexpr char hex_digits[] = "0123456789abcdef";

    }  // namespace detail

    std::string display_value(const value& v) {
        switch (kind_of(v)) {
            case value_kind::null:
                return "NULL";
            case value_kind::integer:
                return std::to_string(std::get<std::int64_t>(v));
            case value_kind::real:
                return "{}"_format(std::get<double>(v));
            case value_kind::text:
                return std::get<std::string>(v);
            case value_kind::blob: {
                const auto& bytes = std::get<blob>(v).bytes;
                std::string out{"x'"};
                out.reserve(bytes.size() * 2U + 3U);
                for (auto b : bytes) {
                    out.push_back(detail::hex_digits[b >> 4U]);
                    out.push_back(detail::hex_digits[b & 0x0FU]);
                }
                out.push_back('\'');
                return out;
            }
        }
        return "NULL";
    }

    void row::set(std::string_view column, value v) {
        auto it = std::ranges::find(fields_, column, &row_field::column);
        if (it != fields_.end()) {
            it->data = std::move(v);
            return;
        }
        fields_.push_back(row_field{.column = std::string{column}, .data = std::move(v)});
    }

    const value* row::find(std::string_view column) const {
        auto it = std::ranges::find(fields_, column, &row_field::column);
        return it == fields_.end() ? nullptr : &it->data;
    }

    // ── statement ───────────────────────────────────────────────────

    statement::statement(sqlite3_stmt* stmt) : stmt_{stmt} {}

    statement::~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement::statement(statement&& other) noexcept : stmt_{std::exchange(other.stmt_, nullptr)} {}

    statement& statement::operator=(statement&& other) noexcept {
        if (this != &other) {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
            stmt_ = std::exchange(other.stmt_, nullptr);
        }
        return *this;
    }

    void statement::check(int rc, std::string_view what) const {
        detail::throw_if(rc, sqlite3_db_handle(stmt_), what);
    }

    bool statement::read_only() const {
        return sqlite3_stmt_readonly(stmt_) != 0;
    }

    int statement::parameter_count() const {
        return sqlite3_bind_parameter_count(stmt_);
    }

    int statement::parameter_index(std::string_view name) const {
        std::string key{name};
        if (!key.empty() && (key[0] == ':' || key[0] == '@' || key[0] == '$')) {
            return sqlite3_bind_parameter_index(stmt_, key.c_str());
        }
        for (char prefix : {':', '@', '$'}) {
            auto prefixed = prefix + key;
            if (auto idx = sqlite3_bind_parameter_index(stmt_, prefixed.c_str()); idx > 0) {
                return idx;
            }
        }
        return 0;
    }

    std::string statement::parameter_name(int index) const {
        const char* name = sqlite3_bind_parameter_name(stmt_, index);
        return name ? std::string{name} : std::string{};
    }

    void statement::bind(int index, const value& v) {
        int rc = SQLITE_OK;
        switch (kind_of(v)) {
            case value_kind::null:
                rc = sqlite3_bind_null(stmt_, index);
                break;
            case value_kind::integer:
                rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(std::get<std::int64_t>(v)));
                break;
            case value_kind::real:
                rc = sqlite3_bind_double(stmt_, index, std::get<double>(v));
                break;
            case value_kind::text: {
                const auto& text = std::get<std::string>(v);
                rc = sqlite3_bind_text64(stmt_, index, text.data(), text.size(), SQLITE_TRANSIENT, SQLITE_UTF8);
                break;
            }
            case value_kind::blob: {
                const auto& bytes = std::get<blob>(v).bytes;
                rc = sqlite3_bind_blob64(stmt_, index, bytes.data(), bytes.size(), SQLITE_TRANSIENT);
                break;
            }
        }
        check(rc, "bind parameter {}"_format(index));
    }

    bool statement::step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw store_error{sqlite3_errmsg(sqlite3_db_handle(stmt_))};
    }

    int statement::column_count() const {
        return sqlite3_column_count(stmt_);
    }

    std::string statement::column_name(int index) const {
        const char* name = sqlite3_column_name(stmt_, index);
        return name ? std::string{name} : std::string{};
    }

    value statement::column_value(int index) const {
        switch (sqlite3_column_type(stmt_, index)) {
            case SQLITE_INTEGER:
                return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt_, index);
            case SQLITE_TEXT: {
                const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
                auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, index));
                return std::string{text, size};
            }
            case SQLITE_BLOB: {
                const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, index));
                auto size = static_cast<size_t>(sqlite3_column_bytes(stmt_, index));
                blob out{};
                if (data) {
                    out.bytes.assign(data, data + size);
                }
                return out;
            }
            default:
                return nullptr;
        }
    }

    // ── store_connection ────────────────────────────────────────────

    store_connection::store_connection(const std::filesystem::path& path, open_mode mode, int busy_timeout_ms) {
        int flags = mode == open_mode::read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
            if (db_) {
                sqlite3_close(db_);
            }
            db_ = nullptr;
            throw store_error{"cannot open {}: {}"_format(path.string(), msg)};
        }

        rc = sqlite3_busy_timeout(db_, std::max(busy_timeout_ms, 0));
        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
            throw store_error{"busy_timeout: {}"_format(msg)};
        }
    }

    store_connection::~store_connection() {
        if (db_) {
            sqlite3_close_v2(db_);
        }
    }

    void store_connection::exec(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "sqlite exec failed";
            sqlite3_free(err);
            throw store_error{msg};
        }
    }

    statement store_connection::prepare(std::string_view sql, std::string_view* tail) {
        if (sql.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            throw store_error{"statement too long"};
        }

        sqlite3_stmt* stmt = nullptr;
        const char* rest = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, &rest);
        if (rc != SQLITE_OK) {
            sqlite3_finalize(stmt);
            throw store_error{sqlite3_errmsg(db_)};
        }

        if (tail) {
            auto consumed = rest ? static_cast<size_t>(rest - sql.data()) : sql.size();
            *tail = sql.substr(std::min(consumed, sql.size()));
        }
        return statement{stmt};
    }

}  // namespace sqlgate
