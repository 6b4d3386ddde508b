/**
 * @file subprocess.hpp
 * @brief POSIX child-process helpers (bounded run, detached launch, lookup).
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/utils/export.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <sys/types.h>

namespace camfleet {
namespace utils {

/**
 * @struct ProcessResult
 * @brief Outcome of a bounded child-process run.
 */
struct CAMFLEET_UTILS_API ProcessResult {
    int exit_code = -1;        ///< exit status, 128+signal, or -1 if never started
    bool started = false;
    bool timed_out = false;    ///< killed because the deadline passed
    std::string stdout_text;
    std::string stderr_text;
    std::string error;         ///< pipe/fork failure description
};

/**
 * @brief Run @p argv, collecting output until it exits or @p timeout passes.
 *
 * On timeout the whole process group is killed with SIGKILL; output read so
 * far is kept. argv[0] is resolved through PATH.
 */
CAMFLEET_UTILS_API ProcessResult runWithTimeout(const std::vector<std::string>& argv,
                                                std::chrono::milliseconds timeout,
                                                size_t maxOutputBytes = 1 << 20);

/**
 * @brief Launch @p argv in its own session without waiting for it.
 * @return Child pid, or -1 on failure.
 */
CAMFLEET_UTILS_API pid_t spawnDetached(const std::vector<std::string>& argv);

/**
 * @brief PIDs whose /proc/<pid>/cmdline contains @p pattern (self excluded).
 */
CAMFLEET_UTILS_API std::vector<pid_t> findProcesses(const std::string& pattern);

/**
 * @brief Send SIGTERM to every process matching @p pattern.
 * @return Number of processes signalled.
 */
CAMFLEET_UTILS_API int terminateMatching(const std::string& pattern);

/**
 * @brief Reap any exited children without blocking.
 * @return Number of children reaped.
 */
CAMFLEET_UTILS_API int reapZombies();

}  // namespace utils
}  // namespace camfleet
