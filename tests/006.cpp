#include "utils.hpp"

namespace sqlgate::test {
    using namespace std::string_view_literals;
    using namespace sqlgate::literals;

    TEST_CASE("006: list_tables reports catalog tables", "[006][schema]") {
        detail::sample_store store{"sqlgate_schema_list"};
        auto tables = store.gateway().list_tables();
        REQUIRE(tables.ok());

        CHECK(std::ranges::find(tables.names, "users") != tables.names.end());
        CHECK(std::ranges::find(tables.names, "posts") != tables.names.end());
    }

    TEST_CASE("006: describe_table reports columns and foreign keys", "[006][schema]") {
        detail::sample_store store{"sqlgate_schema_describe"};
        auto gateway = store.gateway();

        auto users = gateway.describe_table("users"sv);
        REQUIRE(users.ok());
        REQUIRE(users.tables.size() == 1U);
        const auto& users_schema = users.tables.front();
        CHECK(users_schema.name == "users");
        REQUIRE(users_schema.columns.size() == 4U);

        const auto& id = users_schema.columns[0];
        CHECK(id.name == "id");
        CHECK(id.type == "INTEGER");
        CHECK(id.primary_key);

        const auto& email = users_schema.columns[2];
        CHECK(email.name == "email");
        CHECK(email.type == "TEXT");
        CHECK_FALSE(email.nullable);
        CHECK_FALSE(email.primary_key);
        CHECK_FALSE(email.default_value.has_value());

        const auto& created = users_schema.columns[3];
        CHECK(created.nullable);
        REQUIRE(created.default_value.has_value());
        CHECK(*created.default_value == "CURRENT_TIMESTAMP");
        CHECK(users_schema.foreign_keys.empty());

        auto posts = gateway.describe_table("posts"sv);
        REQUIRE(posts.ok());
        const auto& fks = posts.tables.front().foreign_keys;
        REQUIRE(fks.size() == 1U);
        CHECK(fks[0].column == "user_id");
        CHECK(fks[0].references_table == "users");
        REQUIRE(fks[0].references_column.has_value());
        CHECK(*fks[0].references_column == "id");
    }

    TEST_CASE("006: unknown tables are not_found", "[006][schema]") {
        detail::sample_store store{"sqlgate_schema_missing"};
        auto result = store.gateway().describe_table("nonexistent_table"sv);
        REQUIRE_FALSE(result.ok());
        CHECK(result.error->kind == error_kind::not_found);
        CHECK(result.error->message == "Table 'nonexistent_table' not found");
    }

    TEST_CASE("006: describe_all covers every table", "[006][schema]") {
        detail::script_store store{
                "sqlgate_schema_all",
                "CREATE TABLE a (x INTEGER PRIMARY KEY);"
                "CREATE TABLE b (y TEXT DEFAULT 'none', a_id INTEGER REFERENCES a);"};
        auto all = store.gateway().describe_all();
        REQUIRE(all.ok());
        REQUIRE(all.tables.size() == 2U);
        CHECK(all.tables[0].name == "a");
        CHECK(all.tables[1].name == "b");

        const auto& b = all.tables[1];
        REQUIRE(b.columns.size() == 2U);
        REQUIRE(b.columns[0].default_value.has_value());
        CHECK(*b.columns[0].default_value == "'none'");
        REQUIRE(b.foreign_keys.size() == 1U);
        CHECK(b.foreign_keys[0].references_table == "a");
        CHECK_FALSE(b.foreign_keys[0].references_column.has_value());
    }

    TEST_CASE("006: sample honours explicit and default limits", "[006][sample]") {
        std::string script{"CREATE TABLE nums (v INTEGER);"};
        for (int i = 1; i <= 15; ++i) {
            script += "INSERT INTO nums VALUES ({});"_format(i);
        }
        detail::script_store store{"sqlgate_sample_limits", script};
        auto gateway = store.gateway();

        auto two = gateway.sample("nums"sv, 2);
        REQUIRE(two.ok());
        CHECK(two.rows.size() == 2U);

        auto fallback = gateway.sample("nums"sv);
        REQUIRE(fallback.ok());
        CHECK(fallback.rows.size() == 10U);

        auto zero = gateway.sample("nums"sv, 0);
        REQUIRE(zero.ok());
        CHECK(zero.rows.empty());

        query_gateway wide{gateway_options{.db_path = store.db_path, .sample_limit = 12}};
        auto configured = wide.sample("nums"sv);
        REQUIRE(configured.ok());
        CHECK(configured.rows.size() == 12U);
    }

    TEST_CASE("006: sample on the seeded users table", "[006][sample]") {
        detail::sample_store store{"sqlgate_sample_users"};
        auto result = store.gateway().sample("users"sv, 2);
        REQUIRE(result.ok());
        REQUIRE(result.rows.size() == 2U);
        CHECK(result.columns == std::vector<std::string>{"id", "name", "email", "created_at"});
    }

    TEST_CASE("006: sample rejects bad requests", "[006][sample]") {
        detail::sample_store store{"sqlgate_sample_errors"};
        auto gateway = store.gateway();

        auto negative = gateway.sample("users"sv, -1);
        REQUIRE_FALSE(negative.ok());
        CHECK(negative.error->kind == error_kind::invalid_request);

        auto empty = gateway.sample(""sv);
        REQUIRE_FALSE(empty.ok());
        CHECK(empty.error->kind == error_kind::invalid_request);

        auto missing = gateway.sample("no_such_table"sv);
        REQUIRE_FALSE(missing.ok());
        CHECK(missing.error->kind == error_kind::execution_error);
        CHECK(detail::contains(missing.error->message, "no such table"));

        // identifiers are quoted, not spliced
        auto injected = gateway.sample("users; DROP TABLE users"sv);
        REQUIRE_FALSE(injected.ok());
        CHECK(injected.error->kind == error_kind::execution_error);
        CHECK(gateway.execute("SELECT COUNT(*) AS n FROM users"sv).ok());
    }

}  // namespace sqlgate::test
