#include <crawlutil/app.hpp>
#include <crawlutil/cli.hpp>
#include <crawlutil/date.hpp>
#include <crawlutil/path.hpp>
#include <crawlutil/spawn.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>

#ifndef CRAWLUTIL_VERSION
#define CRAWLUTIL_VERSION "unknown"
#endif

namespace crawlutil {

static void print_help() {
  std::cout <<
      R"(crawlutil - path, date and process helpers

Usage:
  crawlutil [--verbose] [--log-file PATH] <command> ...

  crawlutil normalize <path>...
  crawlutil trim --parent <dir> <path>...
  crawlutil date <text> [--format FMT]... [--json]
  crawlutil spawn [--timeout-ms N] [--cwd DIR] [--] <cmd> [args...]
  crawlutil exec  [--timeout-ms N] [--cwd DIR] [--max-buffer BYTES] [--] <cmd> [args...]
  crawlutil version

Environment:
  CRAWLUTIL_LOG_LEVEL         trace|debug|info|warn|error|critical|off
  CRAWLUTIL_SPAWN_TIMEOUT_MS  default --timeout-ms (0 = none)
  CRAWLUTIL_MAX_BUFFER        default --max-buffer for exec
)";
}

static void setup_logging(const Config &cfg) {
  // stdout занят выводом команды, лог - только в stderr или файл
  auto logger = std::make_shared<spdlog::logger>(
      "crawlutil", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  spdlog::set_default_logger(logger);
  if (cfg.log_file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.log_file->string(), cfg.log_rotate_max, cfg.log_rotate_files);
      spdlog::set_default_logger(
          std::make_shared<spdlog::logger>("crawlutil", sink));
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("failed to open log file {}: {}; logging to stderr",
                   cfg.log_file->string(), e.what());
    }
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (cfg.verbose)
    spdlog::set_level(spdlog::level::debug);
  if (!cfg.log_level.empty()) {
    auto lvl = spdlog::level::from_str(cfg.log_level);
    // from_str отдаёт off для неизвестных имён
    if (lvl == spdlog::level::off && cfg.log_level != "off")
      spdlog::warn("unknown log level '{}'", cfg.log_level);
    else
      spdlog::set_level(lvl);
  }
}

static int report(const SpawnError &e) {
  spdlog::error("{}", e.what());
  if (e.kind() == SpawnError::Kind::Launch)
    return 127;
  if (e.exit_code() && *e.exit_code() != 0)
    return *e.exit_code();
  return 1;
}

static void write_out(const std::string &s) {
  std::fwrite(s.data(), 1, s.size(), stdout);
  std::fflush(stdout);
}

template <typename C>
static SpawnOptions spawn_options(const C &c, const Config &cfg) {
  SpawnOptions o;
  o.cwd = c.cwd;
  o.timeout = c.timeout_ms ? std::chrono::milliseconds(*c.timeout_ms)
                           : cfg.spawn_timeout;
  return o;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (pr.global.verbose)
    cfg_.verbose = true;
  if (pr.global.log_file)
    cfg_.log_file = *pr.global.log_file;
  setup_logging(cfg_);

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          fmt::print("crawlutil {}\n", CRAWLUTIL_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdNormalize>) {
          for (const auto &p : c.paths)
            fmt::print("{}\n", to_slash(p));
          return 0;

        } else if constexpr (std::is_same_v<T, CmdTrim>) {
          for (const auto &p : c.paths)
            fmt::print("{}\n", to_string(trim_parents(p, c.parent)));
          return 0;

        } else if constexpr (std::is_same_v<T, CmdDate>) {
          auto ts = extract_date(c.text, c.formats);
          if (!ts) {
            spdlog::info("no date found in '{}'", c.text);
            fmt::print("{}\n", c.json ? "null" : "");
            return 1;
          }
          if (c.json)
            fmt::print("{{\"instant\":\"{}\",\"date\":\"{}\",\"offset_minutes\":{}}}\n",
                       ts->to_utc_iso(), ts->to_iso_date(),
                       ts->offset_minutes());
          else
            fmt::print("{}\n", ts->to_iso());
          return 0;

        } else if constexpr (std::is_same_v<T, CmdSpawn>) {
          try {
            write_out(spawn(c.command, c.args, spawn_options(c, cfg_)));
            return 0;
          } catch (const SpawnError &e) {
            return report(e);
          }

        } else if constexpr (std::is_same_v<T, CmdExec>) {
          SpawnOptions o = spawn_options(c, cfg_);
          o.max_buffer = c.max_buffer.value_or(cfg_.max_buffer);
          try {
            write_out(exec_file(c.command, c.args, o));
            return 0;
          } catch (const SpawnError &e) {
            return report(e);
          }
        }
      },
      *pr.cmd);
}

} // namespace crawlutil
