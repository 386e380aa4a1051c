#pragma once

#include "gateway.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgate::json {

    /*
     * JSON rendering of gateway results.
     *
     * Values keep their storage class: integers and reals as numbers (reals
     * always carry a fraction or exponent), text as strings, NULL as null and
     * blobs as base64 strings. Non-finite reals become null. Row objects list
     * columns in statement order.
     */
    std::string base64_encode(std::span<const std::uint8_t> bytes);

    std::string to_json(const value& v);
    std::string to_json(const row& r);
    std::string rows_to_json(const std::vector<row>& rows);

    // {"columns":[...],"foreign_keys":[...]}
    std::string to_json(const table_schema& schema);
    // {"<table>":{"columns":...,"foreign_keys":...},...} in catalog order
    std::string schema_to_json(const std::vector<table_schema>& tables);
    std::string table_names_to_json(const std::vector<std::string>& names);

    // {"error":"...","kind":"...","query":"..."}; query omitted when absent
    std::string error_payload(const query_error& err);
    // {"success":true,"data":[...],"row_count":N}, or error_payload on failure
    std::string execute_payload(const query_result& result);

    // Parameters from a JSON array (positional) or object (named); empty input
    // or null means none. Returns nullopt and sets `error` on anything else.
    std::optional<query_params> parse_params(std::string_view raw, std::string& error);

}  // namespace sqlgate::json
