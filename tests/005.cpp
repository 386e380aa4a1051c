#include "utils.hpp"

namespace sqlgate::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: select returns the seeded row", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_roundtrip"};
        auto gateway = store.gateway();

        auto result = gateway.execute("SELECT name, email FROM users WHERE id = 1"sv);
        REQUIRE(result.ok());
        CHECK(result.columns == std::vector<std::string>{"name", "email"});
        REQUIRE(result.rows.size() == 1U);

        row expected{};
        expected.set("name", std::string{"John Doe"});
        expected.set("email", std::string{"john@example.com"});
        CHECK(result.rows[0] == expected);
    }

    TEST_CASE("005: rows follow statement order and count", "[005][execute]") {
        detail::script_store store{
                "sqlgate_exec_order",
                "CREATE TABLE n (v INTEGER);"
                "INSERT INTO n VALUES (3), (1), (5), (2), (4);"};
        auto gateway = store.gateway();

        auto result = gateway.execute("SELECT v FROM n ORDER BY v DESC"sv);
        REQUIRE(result.ok());
        REQUIRE(result.rows.size() == 5U);
        for (size_t i = 0; i < result.rows.size(); ++i) {
            CHECK(std::get<std::int64_t>(*result.rows[i].find("v")) == static_cast<std::int64_t>(5 - i));
        }

        auto none = gateway.execute("SELECT v FROM n WHERE v > 100"sv);
        REQUIRE(none.ok());
        CHECK(none.rows.empty());
        CHECK(none.columns == std::vector<std::string>{"v"});
    }

    TEST_CASE("005: values keep their storage class", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_types"};
        auto gateway = store.gateway();

        auto result = gateway.execute("SELECT 42 AS i, 2.5 AS r, 'txt' AS t, NULL AS z, x'00ff10' AS b"sv);
        REQUIRE(result.ok());
        REQUIRE(result.rows.size() == 1U);
        const auto& r = result.rows[0];

        CHECK(kind_of(*r.find("i")) == value_kind::integer);
        CHECK(std::get<std::int64_t>(*r.find("i")) == 42);
        CHECK(kind_of(*r.find("r")) == value_kind::real);
        CHECK(std::get<double>(*r.find("r")) == 2.5);
        CHECK(std::get<std::string>(*r.find("t")) == "txt");
        CHECK(kind_of(*r.find("z")) == value_kind::null);
        CHECK(std::get<blob>(*r.find("b")).bytes == std::vector<std::uint8_t>{0x00, 0xFF, 0x10});
    }

    TEST_CASE("005: duplicate column names collapse", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_dupes"};
        auto gateway = store.gateway();

        auto result = gateway.execute("SELECT 1 AS a, 2 AS b, 3 AS a"sv);
        REQUIRE(result.ok());
        CHECK(result.columns == std::vector<std::string>{"a", "b", "a"});
        REQUIRE(result.rows.size() == 1U);
        const auto& r = result.rows[0];
        REQUIRE(r.size() == 2U);
        CHECK(r.fields()[0].column == "a");
        CHECK(std::get<std::int64_t>(r.fields()[0].data) == 3);
        CHECK(r.fields()[1].column == "b");
    }

    TEST_CASE("005: positional and named parameters bind", "[005][execute][params]") {
        detail::sample_store store{"sqlgate_exec_params"};
        auto gateway = store.gateway();

        query_params positional{};
        positional.positional.push_back(std::string{"jane@example.com"});
        auto by_email = gateway.execute("SELECT name FROM users WHERE email = ?"sv, positional);
        REQUIRE(by_email.ok());
        REQUIRE(by_email.rows.size() == 1U);
        CHECK(std::get<std::string>(*by_email.rows[0].find("name")) == "Jane Smith");

        query_params named{};
        named.named.emplace_back("id", std::int64_t{1});
        auto by_id = gateway.execute("SELECT name FROM users WHERE id = :id"sv, named);
        REQUIRE(by_id.ok());
        REQUIRE(by_id.rows.size() == 1U);
        CHECK(std::get<std::string>(*by_id.rows[0].find("name")) == "John Doe");
    }

    TEST_CASE("005: parameter mismatches are execution errors", "[005][execute][params]") {
        detail::sample_store store{"sqlgate_exec_param_errors"};
        auto gateway = store.gateway();

        auto missing = gateway.execute("SELECT name FROM users WHERE id = ?"sv);
        REQUIRE_FALSE(missing.ok());
        CHECK(missing.error->kind == error_kind::execution_error);
        CHECK(missing.error->message ==
              "Incorrect number of bindings supplied. The current statement uses 1, and there are 0 supplied.");

        query_params wrong_name{};
        wrong_name.named.emplace_back("nope", std::int64_t{1});
        auto unknown = gateway.execute("SELECT name FROM users WHERE id = :id"sv, wrong_name);
        REQUIRE_FALSE(unknown.ok());
        CHECK(unknown.error->message == "unknown binding parameter: nope");

        query_params partial{};
        partial.named.emplace_back("a", std::int64_t{1});
        auto unbound = gateway.execute("SELECT :a, :b"sv, partial);
        REQUIRE_FALSE(unbound.ok());
        CHECK(unbound.error->message == "You did not supply a value for binding parameter :b.");

        query_params mixed{};
        mixed.positional.push_back(std::int64_t{1});
        mixed.named.emplace_back("id", std::int64_t{1});
        auto both = gateway.execute("SELECT ?"sv, mixed);
        REQUIRE_FALSE(both.ok());
        CHECK(both.error->message == "positional and named parameters cannot be mixed");
    }

    TEST_CASE("005: denied statements never reach the store", "[005][execute][policy]") {
        detail::sample_store store{"sqlgate_exec_canary"};
        auto gateway = store.gateway();

        auto denied = gateway.execute("DELETE FROM users"sv);
        REQUIRE_FALSE(denied.ok());
        CHECK(denied.error->kind == error_kind::policy_violation);
        CHECK(denied.error->message == select_only_message);
        REQUIRE(denied.error->query.has_value());
        CHECK(*denied.error->query == "DELETE FROM users");

        auto count = gateway.execute("SELECT COUNT(*) AS n FROM users"sv);
        REQUIRE(count.ok());
        CHECK(std::get<std::int64_t>(*count.rows[0].find("n")) == 2);
    }

    TEST_CASE("005: gateway on a missing file reports an execution error", "[005][execute]") {
        detail::temp_dir temp{"sqlgate_exec_nofile"};
        query_gateway gateway{gateway_options{.db_path = temp.path / "missing.db"}};

        auto result = gateway.execute("SELECT 1"sv);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error->kind == error_kind::execution_error);
        CHECK_FALSE(std::filesystem::exists(temp.path / "missing.db"));

        // policy denial does not need the store
        auto denied = gateway.execute("DROP TABLE users"sv);
        REQUIRE_FALSE(denied.ok());
        CHECK(denied.error->kind == error_kind::policy_violation);
    }

    TEST_CASE("005: only one statement per call", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_multi"};
        auto gateway = store.gateway();

        auto multi = gateway.execute("SELECT 1; DELETE FROM users"sv);
        REQUIRE_FALSE(multi.ok());
        CHECK(multi.error->kind == error_kind::execution_error);
        CHECK(multi.error->message == "You can only execute one statement at a time.");

        auto trailing = gateway.execute("SELECT 1;  -- trailing comment\n"sv);
        CHECK(trailing.ok());

        auto count = gateway.execute("SELECT COUNT(*) AS n FROM users"sv);
        REQUIRE(count.ok());
        CHECK(std::get<std::int64_t>(*count.rows[0].find("n")) == 2);
    }

    TEST_CASE("005: engine errors come back as execution errors", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_errors"};
        auto gateway = store.gateway();

        auto missing_table = gateway.execute("SELECT * FROM nope"sv);
        REQUIRE_FALSE(missing_table.ok());
        CHECK(missing_table.error->kind == error_kind::execution_error);
        CHECK(detail::contains(missing_table.error->message, "no such table"));

        auto bad_syntax = gateway.execute("SELECT FROM"sv);
        REQUIRE_FALSE(bad_syntax.ok());
        CHECK(bad_syntax.error->kind == error_kind::execution_error);

        // later calls are unaffected
        CHECK(gateway.execute("SELECT 1"sv).ok());
    }

    TEST_CASE("005: repeated reads are identical", "[005][execute]") {
        detail::sample_store store{"sqlgate_exec_idempotent"};
        auto gateway = store.gateway();

        auto first = gateway.execute("SELECT * FROM posts ORDER BY id"sv);
        auto second = gateway.execute("SELECT * FROM posts ORDER BY id"sv);
        REQUIRE(first.ok());
        REQUIRE(second.ok());
        CHECK(first.rows == second.rows);
        CHECK(first.columns == second.columns);
    }

    TEST_CASE("005: WITH statements run when enabled", "[005][execute][policy]") {
        detail::sample_store store{"sqlgate_exec_with"};

        auto text = "WITH u AS (SELECT name FROM users) SELECT COUNT(*) AS n FROM u"sv;
        CHECK(store.gateway().execute(text).error->kind == error_kind::policy_violation);

        auto result = store.gateway(policy_options{.allow_with = true}).execute(text);
        REQUIRE(result.ok());
        CHECK(std::get<std::int64_t>(*result.rows[0].find("n")) == 2);
    }

}  // namespace sqlgate::test
