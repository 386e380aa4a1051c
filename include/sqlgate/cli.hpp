#pragma once

#include "bootstrap.hpp"
#include "config.hpp"
#include "gateway.hpp"

#include <iosfwd>
#include <optional>

namespace sqlgate::cli {

    // Fills unset settings from SQLGATE_DB_PATH/DATABASE_PATH, PORT and SQLGATE_BIND.
    // Returns false (with a message on `err`) when a variable holds an invalid value.
    bool apply_environment(startup_config& cfg, std::ostream& err);

    // nullopt to continue startup, otherwise the process exit code.
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    bootstrap_options make_bootstrap_options(const startup_config& cfg);
    gateway_options make_gateway_options(const startup_config& cfg);

    void print_config(const startup_config& cfg, std::ostream& os);
    void print_result(const query_result& result, output_mode mode, std::ostream& out, std::ostream& err);

    int run_query(const startup_config& cfg, const query_gateway& gateway);
    void run_repl(startup_config& cfg, const query_gateway& gateway);

}  // namespace sqlgate::cli
