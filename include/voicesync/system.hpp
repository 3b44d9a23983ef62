/**
 * @file system.hpp
 * @brief System utilities: CPU limit detection, worker sizing, scratch space
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker count for the idea pool
 *
 *          - Per-idea scratch directory management
 *
 *          - Interpretation of child process exit statuses
 *
 *          - Time formatting utilities
 */

#ifndef VOICESYNC_SYSTEM_HPP
#define VOICESYNC_SYSTEM_HPP

#include <string>
#include <vector>

#include "errors.hpp"

namespace voicesync {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In containers std::thread::hardware_concurrency() reports the host's
 *       cores. This reads the cgroup limits instead:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `cpu.cfs_quota_us` / `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus(.effective)` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/// Parse a cpuset list such as "0-3,6"; malformed input yields {}
std::vector<int> parse_cpuset_string(const std::string &line);

/**
 * @brief Workers for a batch: min(max_parallel, idea_count, cpu_limit).
 * @return 0 only when there are no ideas
 */
int calculate_worker_count(int max_parallel, size_t idea_count, int cpu_limit);

// **---- Scratch Space ----**

/**
 * @brief Create a fresh scratch directory for one idea under output_dir.
 * @param path Output: absolute directory path
 * @return Ok or IoFailure
 */
ErrorCode create_scratch_dir(const std::string &output_dir, size_t idea_index,
                             std::string &path);

/**
 * @brief Remove a scratch directory tree.
 * @note Failures are logged as warnings; the clip itself is already safe.
 */
void remove_scratch_dir(const std::string &path);

// **---- Child Processes ----**

/**
 * @brief Whether a std::system() status means the child was stopped by
 *        Ctrl-C.
 *
 * @note std::system() ignores SIGINT in the caller while it waits, so the
 *       interrupt is only visible in the child's status: either killed by
 *       SIGINT, or a shell that exited with 128 + SIGINT.
 */
bool interrupted_status(int status);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.
 */
std::string format_time(double seconds);

} // namespace voicesync

#endif // VOICESYNC_SYSTEM_HPP
