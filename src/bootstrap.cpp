#include "sqlgate/bootstrap.hpp"

#include "sqlgate/format.hpp"
#include "sqlgate/store.hpp"
#include "sqlgate/utils.hpp"

extern "C" {
#include <unistd.h>
}

#include <atomic>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

using namespace sqlgate::literals;
namespace fs = std::filesystem;

namespace sqlgate {

    namespace detail {

        static std::atomic<unsigned> staging_counter{0};

        static bootstrap_report failure(std::string message) {
            return {.success = false, .created = false, .message = std::move(message)};
        }

        static std::optional<std::string> read_script(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                return std::nullopt;
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static void remove_quietly(const fs::path& path) {
            std::error_code ec{};
            fs::remove(path, ec);
            fs::path journal = path;
            journal += "-journal";
            fs::remove(journal, ec);
        }

        static bootstrap_report verify_existing(const bootstrap_options& opts) {
            try {
                store_connection conn{opts.db_path, open_mode::read_only, opts.busy_timeout_ms};
                auto stmt = conn.prepare("SELECT count(*) FROM sqlite_master"sv);
                (void)stmt.step();
            } catch (const store_error& e) {
                return failure("database {} is not usable: {}"_format(opts.db_path.string(), e.what()));
            }
            return {.success = true, .created = false, .message = "using database {}"_format(opts.db_path.string())};
        }

    }  // namespace detail

    bootstrap_report bootstrap_store(const bootstrap_options& opts) {
        if (opts.db_path.empty()) {
            return detail::failure("no database path configured");
        }

        std::error_code ec{};
        if (fs::exists(opts.db_path, ec)) {
            return detail::verify_existing(opts);
        }
        if (ec) {
            return detail::failure("cannot stat {}: {}"_format(opts.db_path.string(), ec.message()));
        }

        std::string script{};
        std::string origin{};
        if (opts.init_script) {
            auto text = detail::read_script(*opts.init_script);
            if (!text) {
                return detail::failure("cannot read init script {}"_format(opts.init_script->string()));
            }
            script = std::move(*text);
            origin = opts.init_script->string();
        }
        else if (opts.seed_sample) {
            script = std::string{sample_dataset_sql};
            origin = "sample dataset";
        }
        else {
            return detail::failure("database {} does not exist and seeding is disabled"_format(opts.db_path.string()));
        }

        if (auto parent = opts.db_path.parent_path(); !parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                return detail::failure("cannot create {}: {}"_format(parent.string(), ec.message()));
            }
        }

        fs::path staging = opts.db_path;
        staging += ".init-{}-{}"_format(static_cast<long>(::getpid()), detail::staging_counter.fetch_add(1));
        detail::remove_quietly(staging);

        try {
            store_connection conn{staging, open_mode::read_write_create, opts.busy_timeout_ms};
            conn.exec(script);
        } catch (const store_error& e) {
            detail::remove_quietly(staging);
            return detail::failure("failed to initialize {} from {}: {}"_format(opts.db_path.string(), origin, e.what()));
        }

        // link(2) never replaces an existing target; losing a race to another
        // process means its database is the one to use
        if (::link(staging.c_str(), opts.db_path.c_str()) != 0) {
            auto err = errno;
            detail::remove_quietly(staging);
            if (err == EEXIST) {
                debug_log("database appeared while bootstrapping ", opts.db_path.string());
                return detail::verify_existing(opts);
            }
            return detail::failure("cannot move database into place at {}: {}"_format(
                    opts.db_path.string(), std::generic_category().message(err)));
        }
        detail::remove_quietly(staging);

        debug_log("bootstrapped ", opts.db_path.string(), " from ", origin);
        return {.success = true,
                .created = true,
                .message = "created database {} from {}"_format(opts.db_path.string(), origin)};
    }

}  // namespace sqlgate
