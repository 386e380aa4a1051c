#pragma once

#include "sqlgate/sqlgate.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace sqlgate::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;
    };

    inline void write_file(const fs::path& p, std::string_view content) {
        std::ofstream out{p};
        REQUIRE(out.good());
        out << content;
    }

    // Builds `script` into `db_path` with a writable connection.
    inline void build_store(const fs::path& db_path, const std::string& script) {
        store_connection conn{db_path, open_mode::read_write_create, 1'000};
        conn.exec(script);
    }

    // Temp directory holding a database built from the bundled sample dataset.
    struct sample_store {
        temp_dir dir;
        fs::path db_path{};

        explicit sample_store(std::string_view prefix) : dir{prefix}, db_path{dir.path / "sample.db"} {
            auto report = bootstrap_store(bootstrap_options{.db_path = db_path});
            REQUIRE(report.success);
        }

        query_gateway gateway(policy_options policy = {}) const {
            return query_gateway{gateway_options{.db_path = db_path, .policy = policy}};
        }
    };

    // Temp directory holding a database built from a caller-supplied script.
    struct script_store {
        temp_dir dir;
        fs::path db_path{};

        script_store(std::string_view prefix, const std::string& script)
                : dir{prefix}, db_path{dir.path / "custom.db"} {
            build_store(db_path, script);
        }

        query_gateway gateway(policy_options policy = {}) const {
            return query_gateway{gateway_options{.db_path = db_path, .policy = policy}};
        }
    };

    // Clears the variables startup config reads and restores them afterwards.
    struct scoped_env {
        static constexpr std::array names{"SQLGATE_DB_PATH", "DATABASE_PATH", "PORT", "SQLGATE_BIND"};
        std::array<std::optional<std::string>, names.size()> saved{};

        scoped_env() {
            for (size_t i = 0; i < names.size(); ++i) {
                if (const char* v = std::getenv(names[i])) {
                    saved[i] = std::string{v};
                }
                ::unsetenv(names[i]);
            }
        }

        ~scoped_env() {
            for (size_t i = 0; i < names.size(); ++i) {
                if (saved[i]) {
                    ::setenv(names[i], saved[i]->c_str(), 1);
                }
                else {
                    ::unsetenv(names[i]);
                }
            }
        }

        void set(const char* name, const char* v) { ::setenv(name, v, 1); }

        scoped_env(const scoped_env&) = delete;
        scoped_env& operator=(const scoped_env&) = delete;
    };

    // argv for parse_cli; argv[0] is the program name.
    struct cli_args {
        std::vector<std::string> storage{};
        std::vector<char*> argv{};

        cli_args(std::initializer_list<std::string_view> args) {
            storage.emplace_back("sqlgate");
            for (auto a : args) {
                storage.emplace_back(a);
            }
            for (auto& s : storage) {
                argv.push_back(s.data());
            }
            argv.push_back(nullptr);
        }

        int argc() const { return static_cast<int>(storage.size()); }
        char** data() { return argv.data(); }
    };

    inline bool contains(std::string_view haystack, std::string_view needle) {
        return haystack.find(needle) != std::string_view::npos;
    }

}  // namespace sqlgate::test::detail
