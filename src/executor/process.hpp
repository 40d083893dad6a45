/**
 * @file process.hpp
 * @brief Spawn a child with piped stdio, stream stdin, capture output, enforce a deadline.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace sandbox_harness {

/**
 * @brief What a finished child left behind.
 */
struct ProcessOutput {
    int exit_code{0};         ///< WEXITSTATUS, or 128 + signal number
    bool signaled{false};
    Bytes stdout_bytes;
    Bytes stderr_bytes;
    WallTime elapsed{0};
};

/**
 * @brief Run @p argv (argv[0] looked up on PATH) to completion or @p timeout.
 *
 * The child is placed in its own process group. stdin receives
 * @p stdin_bytes and is then closed; a child that stops reading early does
 * not fail the call. stdout and stderr are drained concurrently in one poll()
 * loop so neither pipe can fill and stall the child.
 *
 * Errors:
 *   - ErrorKind::Launch if the child cannot be spawned or reaped.
 *   - ErrorKind::Timeout if the deadline passes first. The whole process
 *     group is SIGKILLed and reaped before returning; the error carries
 *     the output captured so far.
 */
Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                  std::string_view stdin_bytes,
                                  std::chrono::milliseconds timeout);

}  // namespace sandbox_harness
