#include <crawlutil/config.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace crawlutil {

static std::optional<long long> env_number(const char *name) {
  const char *e = std::getenv(name);
  if (!e || !*e)
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(e, &end, 10);
  if (errno != 0 || *end != '\0' || v < 0) {
    spdlog::warn("ignoring {}={}: not a non-negative number", name, e);
    return std::nullopt;
  }
  return v;
}

Config Config::from_env() {
  Config cfg;
  if (const char *e = std::getenv("CRAWLUTIL_LOG_LEVEL"))
    cfg.log_level = e;
  if (auto v = env_number("CRAWLUTIL_SPAWN_TIMEOUT_MS")) {
    if (*v > std::numeric_limits<int>::max())
      spdlog::warn("ignoring CRAWLUTIL_SPAWN_TIMEOUT_MS={}: out of range", *v);
    else
      cfg.spawn_timeout = std::chrono::milliseconds(*v);
  }
  if (auto v = env_number("CRAWLUTIL_MAX_BUFFER"))
    cfg.max_buffer = static_cast<std::size_t>(*v);
  return cfg;
}

} // namespace crawlutil
