// main.cpp
#include "system/system_manager.hpp"
#include <iostream>
#include <string>

using namespace QuantSignal::System;

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <bars_csv> <symbol> [config_dir]" << std::endl;
        return 1;
    }

    const std::string bars_csv_path = argv[1];
    const std::string symbol = argv[2];
    const std::string config_directory = argc == 4 ? argv[3] : "config";

    try {
        // Initialize system - config loading, logging context and writer thread
        SystemInitializationResult initialization_result = initialize(config_directory);

        int exit_code = run(initialization_result, bars_csv_path, symbol);

        shutdown(initialization_result);
        return exit_code;
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }
}
