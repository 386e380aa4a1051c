#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sqlgate {

    struct bootstrap_options {
        std::filesystem::path db_path{};
        std::optional<std::filesystem::path> init_script{};
        bool seed_sample{true};
        int busy_timeout_ms{5'000};
    };

    struct bootstrap_report {
        bool success{false};
        bool created{false};
        std::string message{};

        explicit operator bool() const { return success; }
    };

    inline constexpr std::string_view sample_dataset_sql = R"sql(
BEGIN;
CREATE TABLE IF NOT EXISTS users (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL,
    email TEXT UNIQUE NOT NULL,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
CREATE TABLE IF NOT EXISTS posts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id INTEGER,
    title TEXT NOT NULL,
    content TEXT,
    created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
    FOREIGN KEY (user_id) REFERENCES users (id)
);
INSERT INTO users (name, email) VALUES ('John Doe', 'john@example.com');
INSERT INTO users (name, email) VALUES ('Jane Smith', 'jane@example.com');
INSERT INTO posts (user_id, title, content) VALUES (1, 'First Post', 'This is my first post!');
INSERT INTO posts (user_id, title, content) VALUES (2, 'Hello World', 'Hello from Jane!');
COMMIT;
)sql";

    /*
     * One-time store initialization; must succeed before any transport serves.
     *
     * An existing file is only opened read-only and checked. A missing file is
     * built from `init_script`, or from `sample_dataset_sql` when seeding is
     * enabled, into a temporary sibling that is renamed into place once the
     * script has run. On failure nothing is left at `db_path`.
     */
    bootstrap_report bootstrap_store(const bootstrap_options& opts);

}  // namespace sqlgate
