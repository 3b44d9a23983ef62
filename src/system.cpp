/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "voicesync/system.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "voicesync/logging.hpp"

namespace voicesync {

// **---- Internal Helpers ----**

namespace {

/// Serializes creation of scratch dirs with removal of their shared parent
std::mutex scratch_mutex;

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f ? val : -1;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

/// CPU quota from cgroup v2 "cpu.max" ("max 100000" or "200000 100000")
int cgroup_v2_quota() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max" || period_str.empty())
    return -1;
  try {
    long quota = std::stol(quota_str);
    long period = std::stol(period_str);
    if (quota > 0 && period > 0)
      return static_cast<int>((quota + period - 1) / period);
  } catch (const std::logic_error &) {
    LOG_WARN("Unreadable /sys/fs/cgroup/cpu.max: '{} {}'", quota_str,
             period_str);
  }
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  size_t pos = 0;
  try {
    while (pos < line.size()) {
      size_t end = line.find_first_of(",-", pos);
      if (end == std::string::npos)
        end = line.size();

      int start_cpu = std::stoi(line.substr(pos, end - pos));

      if (end < line.size() && line[end] == '-') {
        /// Range like "0-3"
        pos = end + 1;
        end = line.find(',', pos);
        if (end == std::string::npos)
          end = line.size();
        int end_cpu = std::stoi(line.substr(pos, end - pos));
        for (int cpu = start_cpu; cpu <= end_cpu; ++cpu)
          cpus.push_back(cpu);
      } else {
        cpus.push_back(start_cpu);
      }

      pos = (end < line.size()) ? end + 1 : line.size();
    }
  } catch (const std::logic_error &) {
    return {};
  }
  return cpus;
}

int detect_cpu_limit() {
  int limit = cgroup_v2_quota();

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0)
      limit = static_cast<int>((quota + period - 1) / period);
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0)
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int calculate_worker_count(int max_parallel, size_t idea_count,
                           int cpu_limit) {
  if (idea_count == 0)
    return 0;
  int workers = std::max(1, max_parallel);
  workers = static_cast<int>(
      std::min<size_t>(static_cast<size_t>(workers), idea_count));
  return std::max(1, std::min(workers, cpu_limit));
}

// **---- Scratch Space ----**

ErrorCode create_scratch_dir(const std::string &output_dir, size_t idea_index,
                             std::string &path) {
  namespace fs = std::filesystem;
  std::error_code ec;

  fs::path dir = fs::absolute(output_dir, ec) / ".voicesync_scratch" /
                 fmt::format("idea_{}_{}", idea_index + 1, getpid());
  if (ec) {
    LOG_ERROR("Cannot resolve output directory {}: {}", output_dir,
              ec.message());
    return ErrorCode::IoFailure;
  }

  std::lock_guard<std::mutex> lock(scratch_mutex);

  /// Leftovers of an earlier crashed run with the same pid
  fs::remove_all(dir, ec);
  ec.clear();

  fs::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create scratch directory {}: {}", dir.string(),
              ec.message());
    return ErrorCode::IoFailure;
  }

  path = dir.string();
  return ErrorCode::Ok;
}

void remove_scratch_dir(const std::string &path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    LOG_WARN("Could not remove scratch directory {}: {}", path, ec.message());
    return;
  }

  /// Drop the shared parent once the last idea is gone
  std::lock_guard<std::mutex> lock(scratch_mutex);
  fs::path parent = fs::path(path).parent_path();
  if (fs::is_empty(parent, ec) && !ec)
    fs::remove(parent, ec);
}

// **---- Child Processes ----**

bool interrupted_status(int status) {
  if (status == -1)
    return false;
  if (WIFSIGNALED(status))
    return WTERMSIG(status) == SIGINT;
  return WIFEXITED(status) && WEXITSTATUS(status) == 128 + SIGINT;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace voicesync
