#pragma once

#include "lob/utility.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lob {

struct ProcessOutput {
    int status = 0;
    std::string out;
    std::string err;
};

/**
 * @brief Runs a subprocess with the parent's stdin, stdout and stderr.
 *
 * Blocks until the child exits. There is no timeout.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Optional working directory for the subprocess.
 * @return The exit status of the child, or an Io error if it could not be started.
 */
Result<int> process_exec(std::vector<std::string> &&args, std::optional<std::string> working_dir = std::nullopt);

/**
 * @brief Runs a subprocess and captures its stdout and stderr.
 *
 * @param args The command line arguments (first argument is the executable).
 * @return Exit status and captured streams, or an Io error if it could not be started.
 */
Result<ProcessOutput> process_capture(std::vector<std::string> &&args,
                                      std::optional<std::string> working_dir = std::nullopt);

/**
 * @brief Runs a subprocess with all of its output discarded.
 */
Result<int> process_quiet(std::vector<std::string> &&args);

} // namespace lob
