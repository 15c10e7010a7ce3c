#include <catch2/catch_all.hpp>
#include <crawlutil/app.hpp>
#include <crawlutil/cli.hpp>
#include <crawlutil/spawn.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace crawlutil;
using Catch::Matchers::ContainsSubstring;

namespace {

struct Argv {
  std::vector<std::string> store;
  std::vector<char*> ptrs;

  explicit Argv(std::vector<std::string> args) : store(std::move(args)) {
    store.insert(store.begin(), "crawlutil");
    for (auto& s : store) ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(store.size()); }
  char** argv() { return ptrs.data(); }
};

ParseResult parse(std::vector<std::string> args) {
  Argv a(std::move(args));
  return parse_cli(a.argc(), a.argv());
}

int run(std::vector<std::string> args) {
  Argv a(std::move(args));
  return App(Config{}).run(a.argc(), a.argv());
}

template <typename F>
std::optional<SpawnError> error_of(F&& f) {
  try {
    f();
  } catch (const SpawnError& e) {
    return e;
  }
  return std::nullopt;
}

// собранный crawlutil запускается как отдельный процесс
SpawnOptions quiet_env() {
  SpawnOptions o;
  o.env["CRAWLUTIL_LOG_LEVEL"] = "";
  return o;
}

} // namespace

TEST_CASE("no arguments prints help") {
  auto r = parse({});
  REQUIRE(r.cmd.has_value());
  REQUIRE(std::holds_alternative<CmdHelp>(*r.cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"--help"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"version"}).cmd));
}

TEST_CASE("global options come before the command") {
  auto r = parse({"-v", "--log-file", "/tmp/x.log", "version"});
  REQUIRE(r.error.empty());
  REQUIRE(r.global.verbose);
  REQUIRE(r.global.log_file == std::optional<std::string>("/tmp/x.log"));
}

TEST_CASE("normalize and trim") {
  auto r = parse({"normalize", "c:\\a\\b", "/x"});
  REQUIRE(r.cmd.has_value());
  auto& n = std::get<CmdNormalize>(*r.cmd);
  REQUIRE(n.paths == std::vector<std::string>{"c:\\a\\b", "/x"});

  REQUIRE(parse({"normalize"}).error == "normalize: path required");

  r = parse({"trim", "--parent", "/foo", "/foo/bar", "\\foo\\baz"});
  REQUIRE(r.cmd.has_value());
  auto& t = std::get<CmdTrim>(*r.cmd);
  REQUIRE(t.parent == "/foo");
  REQUIRE(t.paths.size() == 2);

  REQUIRE(parse({"trim", "/foo/bar"}).error ==
          "trim: --parent <dir> and at least one path required");
  REQUIRE(parse({"trim", "--parent", "/foo"}).error ==
          "trim: --parent <dir> and at least one path required");
}

TEST_CASE("date options") {
  auto r = parse({"date", "11-13-2010", "--format", "MM-dd-yyyy", "--json"});
  REQUIRE(r.cmd.has_value());
  auto& d = std::get<CmdDate>(*r.cmd);
  REQUIRE(d.text == "11-13-2010");
  REQUIRE(d.formats == std::vector<std::string>{"MM-dd-yyyy"});
  REQUIRE(d.json);

  REQUIRE(parse({"date"}).error == "date: text required");
  REQUIRE(parse({"date", "a", "b"}).error == "date: unexpected argument b");
}

TEST_CASE("spawn and exec options") {
  auto r = parse({"spawn", "--timeout-ms", "500", "--cwd", "/tmp", "--", "ls", "-l"});
  REQUIRE(r.cmd.has_value());
  auto& s = std::get<CmdSpawn>(*r.cmd);
  REQUIRE(s.command == "ls");
  REQUIRE(s.args == std::vector<std::string>{"-l"});
  REQUIRE(s.timeout_ms == std::optional<int>(500));
  REQUIRE(s.cwd == "/tmp");

  r = parse({"spawn", "--timeout-ms", "2147483647", "true"});
  REQUIRE(r.error.empty());
  REQUIRE(std::get<CmdSpawn>(*r.cmd).timeout_ms == std::optional<int>(2147483647));

  r = parse({"exec", "--max-buffer", "1024", "cat", "-n", "f"});
  REQUIRE(r.cmd.has_value());
  auto& e = std::get<CmdExec>(*r.cmd);
  REQUIRE(e.command == "cat");
  REQUIRE(e.args == std::vector<std::string>{"-n", "f"});
  REQUIRE(e.max_buffer == std::optional<std::size_t>(1024));

  // аргументы после команды не разбираются как опции
  r = parse({"-v", "spawn", "grep", "--cwd", "x"});
  REQUIRE(r.global.verbose);
  REQUIRE(std::get<CmdSpawn>(*r.cmd).args ==
          std::vector<std::string>{"--cwd", "x"});
}

TEST_CASE("command line errors") {
  REQUIRE(parse({"spawn"}).error == "spawn: command required");
  REQUIRE(parse({"exec", "--cwd", "/tmp"}).error == "exec: command required");
  REQUIRE(parse({"spawn", "--max-buffer", "5", "ls"}).error ==
          "spawn: unknown option --max-buffer");
  REQUIRE(parse({"exec", "--timeout-ms", "soon", "ls"}).error ==
          "exec: --timeout-ms expects a number");
  REQUIRE(parse({"spawn", "--timeout-ms", "4294967496", "sleep", "1"}).error ==
          "spawn: --timeout-ms out of range");
  REQUIRE_FALSE(parse({"spawn", "--timeout-ms", "4294967496", "sleep", "1"})
                    .cmd.has_value());
  REQUIRE(parse({"frobnicate"}).error == "unknown command: frobnicate");
  REQUIRE_FALSE(parse({"frobnicate"}).cmd.has_value());
}

TEST_CASE("exit codes") {
  REQUIRE(run({"version"}) == 0);
  REQUIRE(run({"frobnicate"}) == 2);
  REQUIRE(run({"normalize", "a\\b"}) == 0);
  REQUIRE(run({"trim", "--parent", "/foo", "/foo/bar"}) == 0);
  REQUIRE(run({"date", "2010-11-13"}) == 0);
  REQUIRE(run({"date", "Created by Maven 3.5.4"}) == 1);
  REQUIRE(run({"spawn", "true"}) == 0);
  REQUIRE(run({"spawn", "sh", "-c", "exit 4"}) == 4);
  REQUIRE(run({"exec", "crawlutil-no-such-program-d41d8cd9"}) == 127);
  REQUIRE(run({"exec", "--max-buffer", "10", "head", "-c", "100", "/dev/zero"}) == 1);
}

TEST_CASE("exit codes for an oversized timeout") {
  REQUIRE(run({"spawn", "--timeout-ms", "4294967496", "sleep", "1"}) == 2);
}

TEST_CASE("stdout carries only the command output") {
  auto e = error_of([]{
    spawn(CRAWLUTIL_CLI, {"date", "Created by Maven", "--json"}, quiet_env());
  });
  REQUIRE(e.has_value());
  REQUIRE(e->exit_code() == 1);
  REQUIRE(e->stdout_text() == "null\n");
  REQUIRE_THAT(e->stderr_text(), ContainsSubstring("no date found"));

  REQUIRE(spawn(CRAWLUTIL_CLI, {"date", "2010-11-13T18:35:12Z", "--json"},
                quiet_env()) ==
          "{\"instant\":\"2010-11-13T18:35:12.000Z\",\"date\":\"2010-11-13\","
          "\"offset_minutes\":0}\n");

  REQUIRE(spawn(CRAWLUTIL_CLI, {"-v", "spawn", "echo", "hi"}, quiet_env()) ==
          "hi\n");

  e = error_of([]{
    spawn(CRAWLUTIL_CLI, {"-v", "spawn", "sh", "-c", "echo hi; exit 3"},
          quiet_env());
  });
  REQUIRE(e.has_value());
  REQUIRE(e->exit_code() == 3);
  REQUIRE(e->stdout_text() == "hi\n");
  REQUIRE_THAT(e->stderr_text(), ContainsSubstring("[debug] [spawn]"));
  REQUIRE_THAT(e->stderr_text(), ContainsSubstring("Command failed: sh -c"));
}
