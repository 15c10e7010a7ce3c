#pragma once
#include "spawn.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace crawlutil {

struct Config {
  std::string log_level;                       // CRAWLUTIL_LOG_LEVEL
  std::chrono::milliseconds spawn_timeout{0};  // CRAWLUTIL_SPAWN_TIMEOUT_MS
  std::size_t max_buffer = kDefaultMaxBuffer;  // CRAWLUTIL_MAX_BUFFER
  bool verbose = false;
  std::optional<std::filesystem::path> log_file;
  std::size_t log_rotate_max = 10 * 1024 * 1024;
  std::size_t log_rotate_files = 3;

  static Config from_env();
};

} // namespace crawlutil
