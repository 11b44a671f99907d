// ============================================================================
// main.cpp — Entry point for the edc_check tool
// ============================================================================
//
// Exit codes:  0  every rule verified without error findings
//              1  a rule carries an error finding, or an input failed
//              2  bad command line
//
// ============================================================================

#include "edc/cli.hpp"
#include "edc/log.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    edc::Options opts;
    try {
        opts = edc::parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        edc::print_usage(argv[0]);
        return 2;
    }

    if (opts.help) {
        edc::print_usage(argv[0]);
        return 0;
    }

    try {
        return edc::run(opts);
    } catch (const std::exception& e) {
        edc::log_error(e.what());
        return 1;
    }
}
