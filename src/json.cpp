#include "sqlgate/json.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/utils.hpp"

#include <glaze/base64/base64.hpp>
#include <glaze/glaze.hpp>

#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

using namespace sqlgate::literals;

namespace sqlgate::json::detail {

    // reals always carry a fraction or exponent; non-finite reals are null
    static std::string real_to_json(double d) {
        if (!std::isfinite(d)) {
            return "null";
        }
        auto text = "{}"_format(d);
        if (text.find_first_of(".eE") == std::string::npos) {
            text += ".0";
        }
        return text;
    }

}  // namespace sqlgate::json::detail

namespace glz {

    template <>
    struct meta<sqlgate::column_info> {
        using T = sqlgate::column_info;
        static constexpr auto value = object(
                "name",
                &T::name,
                "type",
                &T::type,
                "nullable",
                &T::nullable,
                "default",
                &T::default_value,
                "primary_key",
                &T::primary_key);
    };

    template <>
    struct meta<sqlgate::foreign_key_info> {
        using T = sqlgate::foreign_key_info;
        static constexpr auto value = object(
                "column", &T::column, "references_table", &T::references_table, "references_column", &T::references_column);
    };

    template <>
    struct meta<sqlgate::table_schema> {
        using T = sqlgate::table_schema;
        static constexpr auto value = object("columns", &T::columns, "foreign_keys", &T::foreign_keys);
    };

    template <>
    struct to<JSON, sqlgate::blob> {
        template <auto Opts>
        static void op(const sqlgate::blob& b, auto&&... args) {
            serialize<JSON>::op<Opts>(sqlgate::json::base64_encode(b.bytes), args...);
        }
    };

    template <>
    struct to<JSON, sqlgate::value> {
        template <auto Opts>
        static void op(const sqlgate::value& v, auto&&... args) {
            if (const auto* d = std::get_if<double>(&v)) {
                serialize<JSON>::op<Opts>(raw_json{sqlgate::json::detail::real_to_json(*d)}, args...);
                return;
            }
            std::visit([&](const auto& x) { serialize<JSON>::op<Opts>(x, args...); }, v);
        }
    };

    // written as one object, keys in statement column order
    template <>
    struct to<JSON, sqlgate::row> {
        template <auto Opts>
        static void op(const sqlgate::row& r, auto&&... args) {
            if (r.empty()) {
                serialize<JSON>::op<Opts>(raw_json{"{}"}, args...);
                return;
            }
            std::vector<std::pair<std::string_view, sqlgate::value>> fields{};
            fields.reserve(r.size());
            for (const auto& field : r.fields()) {
                fields.emplace_back(field.column, field.data);
            }
            serialize<JSON>::op<Opts>(fields, args...);
        }
    };

}  // namespace glz

namespace sqlgate::json {

    namespace detail {

        static constexpr glz::opts keep_nulls{.skip_null_members = false};

        struct error_body {
            std::string error{};
            std::string kind{};
            std::optional<std::string> query{};
            struct glaze {
                using T = error_body;
                static constexpr auto value = glz::object(&T::error, &T::kind, &T::query);
            };
        };

        struct execute_body {
            bool success{true};
            std::span<const row> data{};
            size_t row_count{};
            struct glaze {
                using T = execute_body;
                static constexpr auto value = glz::object(&T::success, &T::data, &T::row_count);
            };
        };

        template <glz::opts Opts = keep_nulls, typename T>
        static std::string write(const T& payload) {
            std::string out{};
            if (auto ec = glz::write<Opts>(payload, out)) {
                throw std::runtime_error{"json write failed: {}"_format(glz::format_error(ec, out))};
            }
            return out;
        }

        static bool integer_literal(std::string_view text) {
            return text.find_first_of(".eE") == std::string_view::npos;
        }

        // one params entry from its JSON text; integer literals bind exactly
        static std::optional<value> scalar_from_json(std::string_view text) {
            text = utils::trim_view(text);
            if (text == "null"sv) {
                return value{nullptr};
            }
            if (text == "true"sv || text == "false"sv) {
                return value{static_cast<std::int64_t>(text == "true"sv ? 1 : 0)};
            }
            if (text.starts_with('"')) {
                std::string s{};
                std::string buffer{text};
                if (glz::read_json(s, buffer)) {
                    return std::nullopt;
                }
                return value{std::move(s)};
            }
            if (text.empty() || !(text.front() == '-' || (text.front() >= '0' && text.front() <= '9'))) {
                return std::nullopt;
            }

            if (integer_literal(text)) {
                if (auto i = utils::parse_arithmetic<std::int64_t>(text)) {
                    return value{*i};
                }
            }

            double d{};
            std::string buffer{text};
            if (glz::read_json(d, buffer)) {
                return std::nullopt;
            }
            if (!integer_literal(text)) {
                constexpr auto lo = static_cast<double>(std::numeric_limits<std::int64_t>::min());
                constexpr auto hi = static_cast<double>(std::numeric_limits<std::int64_t>::max());
                if (std::trunc(d) == d && d >= lo && d < hi) {
                    return value{static_cast<std::int64_t>(d)};
                }
            }
            return value{d};
        }

    }  // namespace detail

    std::string base64_encode(std::span<const std::uint8_t> bytes) {
        return glz::write_base64(std::string_view{reinterpret_cast<const char*>(bytes.data()), bytes.size()});
    }

    std::string to_json(const value& v) {
        return detail::write(v);
    }

    std::string to_json(const row& r) {
        return detail::write(r);
    }

    std::string rows_to_json(const std::vector<row>& rows) {
        return detail::write(rows);
    }

    std::string to_json(const table_schema& schema) {
        return detail::write(schema);
    }

    std::string schema_to_json(const std::vector<table_schema>& tables) {
        std::vector<std::pair<std::string_view, table_schema>> by_name{};
        by_name.reserve(tables.size());
        for (const auto& table : tables) {
            by_name.emplace_back(table.name, table);
        }
        if (by_name.empty()) {
            return "{}";
        }
        return detail::write(by_name);
    }

    std::string table_names_to_json(const std::vector<std::string>& names) {
        return detail::write(names);
    }

    std::string error_payload(const query_error& err) {
        // query is omitted when absent
        return detail::write<glz::opts{}>(
                detail::error_body{.error = err.message, .kind = std::string{to_string(err.kind)}, .query = err.query});
    }

    std::string execute_payload(const query_result& result) {
        if (!result.ok()) {
            return error_payload(*result.error);
        }
        return detail::write(detail::execute_body{.data = result.rows, .row_count = result.rows.size()});
    }

    std::optional<query_params> parse_params(std::string_view raw, std::string& error) {
        query_params params{};
        auto text = utils::trim_view(raw);
        if (text.empty() || text == "null"sv) {
            return params;
        }

        constexpr auto bad_entry = "params entries must be null, boolean, number or string";
        std::string buffer{text};

        if (text.front() == '[') {
            std::vector<glz::raw_json> items{};
            if (glz::read_json(items, buffer)) {
                error = "params must be valid JSON";
                return std::nullopt;
            }
            for (const auto& item : items) {
                auto v = detail::scalar_from_json(item.str);
                if (!v) {
                    error = bad_entry;
                    return std::nullopt;
                }
                params.positional.push_back(std::move(*v));
            }
            return params;
        }

        if (text.front() == '{') {
            std::map<std::string, glz::raw_json> fields{};
            if (glz::read_json(fields, buffer)) {
                error = "params must be valid JSON";
                return std::nullopt;
            }
            for (const auto& [name, item] : fields) {
                auto v = detail::scalar_from_json(item.str);
                if (!v) {
                    error = bad_entry;
                    return std::nullopt;
                }
                params.named.emplace_back(name, std::move(*v));
            }
            return params;
        }

        glz::generic scalar{};
        if (glz::read_json(scalar, buffer)) {
            error = "params must be valid JSON";
            return std::nullopt;
        }
        error = "params must be an array or an object";
        return std::nullopt;
    }

}  // namespace sqlgate::json
