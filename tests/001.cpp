#include "utils.hpp"

namespace sqlgate::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: leading token is folded and whitespace-trimmed", "[001][policy]") {
        CHECK(leading_token("SELECT 1"sv) == "select");
        CHECK(leading_token("  \t\n select * from users"sv) == "select");
        CHECK(leading_token("SeLeCt*FROM users"sv) == "select");
        CHECK(leading_token("selectx FROM t"sv) == "selectx");
        CHECK(leading_token(""sv).empty());
        CHECK(leading_token("   "sv).empty());
        CHECK(leading_token("(SELECT 1)"sv).empty());
    }

    TEST_CASE("001: select statements pass the gate", "[001][policy]") {
        CHECK(evaluate_policy("SELECT * FROM users"sv).allowed);
        CHECK(evaluate_policy("select id from users"sv).allowed);
        CHECK(evaluate_policy("\n\t  SELECT 1"sv).allowed);
        CHECK(evaluate_policy("SELECT\n  name\nFROM users"sv).allowed);
        CHECK(evaluate_policy("SELECT 'drop table users'"sv).allowed);
    }

    TEST_CASE("001: non-select statements are denied", "[001][policy]") {
        for (auto text :
             {"DELETE FROM users"sv,
              "drop table users"sv,
              "INSERT INTO users VALUES (1)"sv,
              "UPDATE users SET name = 'x'"sv,
              "PRAGMA table_info(users)"sv,
              "ATTACH DATABASE 'x' AS y"sv,
              "WITH t AS (SELECT 1) SELECT * FROM t"sv,
              "EXPLAIN SELECT 1"sv,
              "-- comment\nSELECT 1"sv,
              "/* c */ SELECT 1"sv,
              ""sv,
              "   "sv}) {
            auto decision = evaluate_policy(text);
            CHECK_FALSE(decision.allowed);
            CHECK(decision.reason == select_only_message);
        }
    }

    TEST_CASE("001: select prefix must end at a token boundary", "[001][policy]") {
        CHECK_FALSE(evaluate_policy("selectx FROM users"sv).allowed);
        CHECK_FALSE(evaluate_policy("select_all"sv).allowed);
        CHECK(evaluate_policy("select*from users"sv).allowed);
        CHECK(evaluate_policy("select(1)"sv).allowed);
    }

    TEST_CASE("001: WITH is accepted only when enabled", "[001][policy]") {
        auto text = "WITH t AS (SELECT 1 AS x) SELECT x FROM t"sv;
        CHECK_FALSE(evaluate_policy(text).allowed);
        CHECK(evaluate_policy(text, policy_options{.allow_with = true}).allowed);
        CHECK_FALSE(evaluate_policy("WITHOUT x"sv, policy_options{.allow_with = true}).allowed);
    }

    TEST_CASE("001: keyword denylist narrows allowed selects", "[001][policy]") {
        policy_options opts{.deny_keywords = true};

        CHECK(evaluate_policy("SELECT name FROM users"sv, opts).allowed);

        auto denied = evaluate_policy("SELECT 'x'; DROP TABLE users"sv, opts);
        CHECK_FALSE(denied.allowed);
        CHECK(denied.reason == "statement contains disallowed keyword: drop");

        auto mixed_case = evaluate_policy("SELECT * FROM users WHERE Delete = 1"sv, opts);
        CHECK_FALSE(mixed_case.allowed);
        CHECK(mixed_case.reason == "statement contains disallowed keyword: delete");

        // whole words only
        CHECK(evaluate_policy("SELECT created_at, updated FROM posts"sv, opts).allowed);
        CHECK(evaluate_policy("SELECT dropped FROM t"sv, opts).allowed);

        // the prefix rule still applies first
        auto prefix = evaluate_policy("DELETE FROM users"sv, opts);
        CHECK(prefix.reason == select_only_message);
    }

    TEST_CASE("001: decision converts to bool", "[001][policy]") {
        CHECK(static_cast<bool>(evaluate_policy("SELECT 1"sv)));
        CHECK_FALSE(static_cast<bool>(evaluate_policy("VACUUM"sv)));
    }

}  // namespace sqlgate::test
