/**
 * plx_run - Runs one processor over one layout IR document
 *
 * Usage:
 *   ./plx_run <layout.json> <processor.json> [--env=<file>] [--verbose]
 *
 * Prints {"data": ..., "validation": {...}} as JSON.
 * Exit code: 0 valid, 1 validation errors, 2 fatal error.
 */

#include "api/json/plx_json.h"
#include "processors/plx_errors.h"
#include "processors/plx_executor.h"
#include "processors/plx_processor_loader.h"
#include "utils/plx_env.h"
#include <iostream>
#include <memory>
#include <string>

using namespace plx::processors;

void print_usage(const char* program_name) {
    std::cout << "Layout rule executor - plx\n" << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " <layout.json> <processor.json> [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --env=<file>         Load PLX_* settings from a .env file" << std::endl;
    std::cout << "  --verbose            Print progress on stdout" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string layout_path = argv[1];
    std::string processor_path = argv[2];
    bool verbose = false;

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.find("--env=") == 0) {
            std::string env_file = arg.substr(6);
            if (!load_env_file(env_file)) {
                std::cerr << "Warning: Cannot read env file: " << env_file << std::endl;
            }
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    plx_engine_config config = plx_engine_config::from_env();
    config.verbose = config.verbose || verbose;

    try {
        plx_processor processor;
        plx_processor_loader::load_file(processor_path, processor);

        auto provider = std::make_shared<plx_layout_json_sio>(config.fingerprint_blocks);
        plx_executor executor(provider, config);
        plx_execution_result result = executor.execute_source(layout_path, processor);

        std::cout << plx_json::dump(plx_variant(result.to_map()), 2) << std::endl;
        return result.validation.success ? 0 : 1;
    } catch (const plx_exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    }
}
