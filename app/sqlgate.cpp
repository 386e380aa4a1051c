#include "sqlgate/sqlgate.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        sqlgate::startup_config cfg{};
        if (auto cli_result = sqlgate::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        auto report = sqlgate::bootstrap_store(sqlgate::cli::make_bootstrap_options(cfg));
        if (!report) {
            std::cerr << "fatal: " << report.message << '\n';
            return 1;
        }
        if (cfg.verbose || (report.created && !cfg.quiet)) {
            std::cerr << report.message << '\n';
        }

        const sqlgate::query_gateway gateway{sqlgate::cli::make_gateway_options(cfg)};

        switch (cfg.mode) {
            case sqlgate::run_mode::query:
                return sqlgate::cli::run_query(cfg, gateway);
            case sqlgate::run_mode::http:
                return sqlgate::http::run_http_server(cfg, gateway);
            case sqlgate::run_mode::mcp:
                return sqlgate::mcp::run_mcp_server(cfg, gateway);
            case sqlgate::run_mode::repl:
                break;
        }

        sqlgate::cli::run_repl(cfg, gateway);
        return 0;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
