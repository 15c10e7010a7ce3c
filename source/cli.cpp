#include <crawlutil/cli.hpp>

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string_view>
#include <type_traits>

namespace crawlutil {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<long long> to_number(const char *s) {
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0' || v < 0)
    return std::nullopt;
  return v;
}

static constexpr long long kMaxTimeoutMs = std::numeric_limits<int>::max();

// [--timeout-ms N] [--cwd DIR] [--max-buffer N] [--] <cmd> [args...]
template <typename C>
static ParseResult parse_run(const std::string &name, int i, int argc,
                             char **argv, bool allow_max_buffer) {
  ParseResult r{};
  C c{};
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--") {
      ++i;
      break;
    }
    if (a == "--timeout-ms" && has_arg(i, argc)) {
      auto v = to_number(argv[++i]);
      if (!v) {
        r.error = name + ": --timeout-ms expects a number";
        return r;
      }
      if (*v > kMaxTimeoutMs) {
        r.error = name + ": --timeout-ms out of range";
        return r;
      }
      c.timeout_ms = static_cast<int>(*v);
    } else if (a == "--cwd" && has_arg(i, argc)) {
      c.cwd = argv[++i];
    } else if (a == "--max-buffer" && allow_max_buffer && has_arg(i, argc)) {
      auto v = to_number(argv[++i]);
      if (!v) {
        r.error = name + ": --max-buffer expects a number";
        return r;
      }
      if constexpr (std::is_same_v<C, CmdExec>)
        c.max_buffer = static_cast<std::size_t>(*v);
    } else if (a.size() > 1 && a[0] == '-') {
      r.error = name + ": unknown option " + std::string(a);
      return r;
    } else {
      break;
    }
  }
  if (i >= argc) {
    r.error = name + ": command required";
    return r;
  }
  c.command = argv[i++];
  for (; i < argc; i++)
    c.args.emplace_back(argv[i]);
  r.cmd = c;
  return r;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};

  int i = 1;
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--verbose" || a == "-v") {
      r.global.verbose = true;
    } else if (a == "--log-file" && has_arg(i, argc)) {
      r.global.log_file = argv[++i];
    } else {
      break;
    }
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string cmd = argv[i++];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "normalize") {
    if (i >= argc) {
      r.error = "normalize: path required";
      return r;
    }
    CmdNormalize c;
    for (; i < argc; i++)
      c.paths.emplace_back(argv[i]);
    r.cmd = c;
    return r;
  }

  if (cmd == "trim") {
    CmdTrim c;
    bool have_parent = false;
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--parent" && has_arg(i, argc)) {
        c.parent = argv[++i];
        have_parent = true;
      } else {
        c.paths.emplace_back(argv[i]);
      }
    }
    if (!have_parent || c.paths.empty()) {
      r.error = "trim: --parent <dir> and at least one path required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "date") {
    CmdDate c;
    bool have_text = false;
    for (; i < argc; i++) {
      std::string_view a = argv[i];
      if (a == "--format" && has_arg(i, argc)) {
        c.formats.emplace_back(argv[++i]);
      } else if (a == "--json") {
        c.json = true;
      } else if (!have_text) {
        c.text = argv[i];
        have_text = true;
      } else {
        r.error = "date: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (!have_text) {
      r.error = "date: text required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  ParseResult pr{};
  if (cmd == "spawn")
    pr = parse_run<CmdSpawn>(cmd, i, argc, argv, false);
  else if (cmd == "exec")
    pr = parse_run<CmdExec>(cmd, i, argc, argv, true);
  else {
    r.error = "unknown command: " + cmd;
    return r;
  }
  pr.global = r.global;
  return pr;
}

} // namespace crawlutil
