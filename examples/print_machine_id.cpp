/**
 * @file print_machine_id.cpp
 * @brief Print this machine's identifier
 *
 * Usage: machineuid_print [--json] [--debug]
 *
 *   --json   print a JSON report instead of the bare identifier
 *   --debug  log which sources are tried (Boost.Log, to stderr)
 *
 * Exits with status 1 if the identifier cannot be read.
 */

#include <machineuid/json.hpp>
#include <machineuid/machineuid.hpp>

#include <cstring>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    bool as_json = false;
    auto config = machineuid::default_config();

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            as_json = true;
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            config.debug = true;
        } else {
            std::cerr << "usage: " << argv[0] << " [--json] [--debug]\n";
            return 2;
        }
    }

    auto result = machineuid::get(config);

    if (as_json) {
        auto report = machineuid::json::result_to_json(result, machineuid::get_platform_name());
        if (config.debug) {
            report["sources"] = machineuid::json::config_to_json(config);
        }
        std::cout << report.dump(2) << "\n";
        return result.is_ok() ? 0 : 1;
    }

    if (result.is_error()) {
        std::cerr << "machineuid: " << machineuid::error_code_to_string(result.error_code())
                  << ": " << result.error_message() << "\n";
        return 1;
    }

    std::cout << result.value() << "\n";
    return 0;
}
