#pragma once

#include <array>
#include <string>
#include <string_view>

namespace sqlgate {

    using namespace std::string_view_literals;

    struct policy_options {
        // Accept a leading WITH (common table expression) as well as SELECT.
        bool allow_with{false};
        // Reject any statement naming one of `denied_keywords` as a whole word.
        bool deny_keywords{false};
    };

    struct policy_decision {
        bool allowed{false};
        std::string reason{};

        explicit operator bool() const { return allowed; }
    };

    inline constexpr auto select_only_message = "Only SELECT queries are allowed for safety"sv;

    inline constexpr std::array denied_keywords{
            "drop"sv,
            "delete"sv,
            "truncate"sv,
            "alter"sv,
            "create"sv,
            "pragma"sv,
            "insert"sv,
            "update"sv,
            "replace"sv,
            "attach"sv,
            "detach"sv,
            "vacuum"sv,
            "reindex"sv,
    };

    // Case-folded first token of `text` after leading whitespace; empty if none.
    std::string leading_token(std::string_view text);

    /*
     * Read-only gate. A statement is allowed only when its leading token is
     * `select` (or `with`, when enabled); everything else is denied. The
     * keyword denylist can only narrow that set.
     *
     * This is a textual check: comment-prefixed statements are denied, and
     * nothing here inspects what a SELECT calls.
     */
    policy_decision evaluate_policy(std::string_view text, const policy_options& opts = {});

}  // namespace sqlgate
