#include "sqlgate/policy.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/utils.hpp"

using namespace sqlgate::literals;

namespace sqlgate {

    namespace detail {

        static bool contains_word(std::string_view haystack, std::string_view word) {
            size_t pos = 0;
            while ((pos = haystack.find(word, pos)) != std::string_view::npos) {
                bool starts_word = pos == 0 || !utils::is_identifier_char(haystack[pos - 1]);
                auto end = pos + word.size();
                bool ends_word = end >= haystack.size() || !utils::is_identifier_char(haystack[end]);
                if (starts_word && ends_word) {
                    return true;
                }
                pos = end;
            }
            return false;
        }

    }  // namespace detail

    std::string leading_token(std::string_view text) {
        auto trimmed = utils::trim_left(text);
        size_t end = 0;
        while (end < trimmed.size() && utils::is_identifier_char(trimmed[end])) {
            ++end;
        }
        return utils::to_lower(trimmed.substr(0, end));
    }

    policy_decision evaluate_policy(std::string_view text, const policy_options& opts) {
        auto token = leading_token(text);

        bool prefix_ok = token == "select"sv || (opts.allow_with && token == "with"sv);
        if (!prefix_ok) {
            return {.allowed = false, .reason = std::string{select_only_message}};
        }

        if (opts.deny_keywords) {
            auto folded = utils::to_lower(text);
            for (auto keyword : denied_keywords) {
                if (detail::contains_word(folded, keyword)) {
                    return {.allowed = false, .reason = "statement contains disallowed keyword: {}"_format(keyword)};
                }
            }
        }

        return {.allowed = true};
    }

}  // namespace sqlgate
