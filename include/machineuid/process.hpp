#pragma once

/**
 * @file process.hpp
 * @brief Helper process execution (POSIX only)
 *
 * Helpers are started directly with a fixed argument list; no shell is
 * involved. The calling thread blocks until the helper exits.
 */

#include "machineuid/machineuid.hpp"

#include <string>
#include <vector>

#if !defined(_WIN32)

namespace machineuid {

/// Captured result of a finished helper process
struct CommandOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    [[nodiscard]] bool success() const { return exit_code == 0; }
};

/**
 * @brief Run a helper process and capture its output
 *
 * argv[0] is resolved through PATH. Fails with ProcessSpawnFailed when the
 * process cannot be created, cannot be executed (exit status 127), exits
 * non-zero, or is killed by a signal.
 *
 * @param argv Program followed by its arguments
 */
[[nodiscard]] Result<CommandOutput> run_command(const std::vector<std::string>& argv);

/**
 * @brief Run a helper process and return its trimmed standard output
 *
 * Additionally fails with ProcessOutputUndecodable when stdout is not UTF-8
 * and with EmptyIdentifier when it holds only whitespace.
 */
[[nodiscard]] Result<std::string> command_stdout(const std::vector<std::string>& argv);

/// Render argv as a single space-separated string for messages
[[nodiscard]] std::string describe_command(const std::vector<std::string>& argv);

}  // namespace machineuid

#endif
