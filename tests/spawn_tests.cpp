#include <catch2/catch_all.hpp>
#include <crawlutil/spawn.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace crawlutil;
namespace fs = std::filesystem;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

static fs::path mkd(const char* name){
  auto d = fs::temp_directory_path() / (std::string("crawlutil_spawn_")+name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

template <typename F>
static std::optional<SpawnError> error_of(F&& f) {
  try {
    f();
  } catch (const SpawnError& e) {
    return e;
  }
  return std::nullopt;
}

// вывод той же команды через popen(3) и /bin/sh
static std::string shell_output(const std::string& cmdline) {
  std::string out;
  FILE* f = ::popen(cmdline.c_str(), "r");
  REQUIRE(f != nullptr);
  std::array<char, 4096> buf{};
  std::size_t n;
  while ((n = std::fread(buf.data(), 1, buf.size(), f)) > 0) out.append(buf.data(), n);
  REQUIRE(::pclose(f) == 0);
  return out;
}

TEST_CASE("spawn output matches the shell") {
  auto dir = mkd("ls");
  { std::ofstream o(dir / "a.txt"); o << "hello\n"; }
  SpawnOptions opts;
  opts.cwd = dir;

  auto expected = shell_output("cd '" + dir.string() + "' && ls -l");
  REQUIRE_THAT(expected, ContainsSubstring("a.txt"));
  REQUIRE(spawn("ls", {"-l"}, opts) == expected);
  REQUIRE(exec_file("ls", {"-l"}, opts) == expected);
}

TEST_CASE("spawn reports a failing command") {
  auto dir = mkd("cat");
  SpawnOptions opts;
  opts.cwd = dir;

  auto a = error_of([&]{ spawn("cat", {"t.txt"}, opts); });
  REQUIRE(a.has_value());
  REQUIRE(a->kind() == SpawnError::Kind::Exit);
  REQUIRE(a->code() == "1");
  REQUIRE(a->exit_code() == 1);
  REQUIRE_THAT(a->stderr_text(), ContainsSubstring("t.txt"));
  REQUIRE_THAT(a->stderr_text(), ContainsSubstring(std::strerror(ENOENT)));
  REQUIRE(std::string(a->what()) == "Command failed: cat t.txt\n" + a->stderr_text());

  auto b = error_of([&]{ exec_file("cat", {"t.txt"}, opts); });
  REQUIRE(b.has_value());
  REQUIRE(b->code() == "1");
  REQUIRE(b->stderr_text() == a->stderr_text());
}

TEST_CASE("spawn reports a missing program like exec_file") {
  const std::string cmd = "crawlutil-no-such-program-d41d8cd9";
  auto a = error_of([&]{ spawn(cmd, {}); });
  auto b = error_of([&]{ exec_file(cmd, {}); });
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->kind() == SpawnError::Kind::Launch);
  REQUIRE(a->code() == "ENOENT");
  REQUIRE(a->code() == b->code());
  REQUIRE(std::string(a->what()) == "spawn " + cmd + " ENOENT");
  REQUIRE(std::string(a->what()) == b->what());
}

TEST_CASE("spawn is not limited by the exec_file buffer") {
  auto dir = mkd("big");
  {
    std::ofstream o(dir / "big.txt", std::ios::binary);
    std::string line(1023, 'x');
    line.push_back('\n');
    for (int i = 0; i < 3 * 1024; i++) o << line;
  }
  SpawnOptions opts;
  opts.cwd = dir;

  SpawnOptions limited = opts;
  limited.max_buffer = 5 * 1024 * 1024;
  auto e = error_of([&]{ exec_file("cat", {"big.txt", "big.txt"}, limited); });
  REQUIRE(e.has_value());
  REQUIRE(e->kind() == SpawnError::Kind::MaxBuffer);
  REQUIRE(e->code() == "ERR_CHILD_PROCESS_STDIO_MAXBUFFER");
  REQUIRE(std::string(e->what()) == "stdout maxBuffer length exceeded");

  auto out = spawn("cat", {"big.txt", "big.txt"}, opts);
  REQUIRE(out.size() == 6u * 1024 * 1024);
}

TEST_CASE("exec_file has a default buffer limit") {
  auto e = error_of([]{ exec_file("head", {"-c", "2000000", "/dev/zero"}); });
  REQUIRE(e.has_value());
  REQUIRE(e->kind() == SpawnError::Kind::MaxBuffer);

  REQUIRE(spawn("head", {"-c", "2000000", "/dev/zero"}).size() == 2000000u);
}

TEST_CASE("timeout kills the child") {
  SpawnOptions opts;
  opts.timeout = 200ms;
  auto started = std::chrono::steady_clock::now();
  auto e = error_of([&]{ spawn("sleep", {"5"}, opts); });
  auto took = std::chrono::steady_clock::now() - started;

  REQUIRE(e.has_value());
  REQUIRE(e->kind() == SpawnError::Kind::Timeout);
  REQUIRE(e->killed());
  REQUIRE(e->signal_name() == std::optional<std::string>("SIGTERM"));
  REQUIRE(took < 4s);
}

TEST_CASE("a child killed by a signal") {
  auto e = error_of([]{ spawn("sh", {"-c", "kill -KILL $$"}); });
  REQUIRE(e.has_value());
  REQUIRE(e->kind() == SpawnError::Kind::Signal);
  REQUIRE_FALSE(e->killed());
  REQUIRE(e->signal_name() == std::optional<std::string>("SIGKILL"));
}

TEST_CASE("spawn_async") {
  auto ok = spawn_async("echo", {"hi"});
  REQUIRE(ok.get() == "hi\n");

  auto bad = spawn_async("sh", {"-c", "echo oops >&2; exit 3"});
  REQUIRE_THROWS_AS(bad.get(), SpawnError);

  auto again = spawn_async("sh", {"-c", "exit 3"});
  auto e = error_of([&]{ again.get(); });
  REQUIRE(e.has_value());
  REQUIRE(e->code() == "3");
}

TEST_CASE("environment and working directory") {
  auto dir = mkd("env");
  SpawnOptions opts;
  opts.cwd = dir;
  opts.env["CRAWLUTIL_TEST_VAR"] = "42";

  REQUIRE(spawn("sh", {"-c", "echo $CRAWLUTIL_TEST_VAR"}, opts) == "42\n");
  auto pwd = spawn("pwd", {}, opts);
  REQUIRE(fs::equivalent(pwd.substr(0, pwd.size() - 1), dir));

  SpawnOptions missing;
  missing.cwd = dir / "nope";
  auto e = error_of([&]{ spawn("pwd", {}, missing); });
  REQUIRE(e.has_value());
  REQUIRE(e->kind() == SpawnError::Kind::Launch);
  REQUIRE(e->code() == "ENOENT");
}

TEST_CASE("large stderr does not block the child") {
  auto out = spawn("sh", {"-c", "head -c 1048576 /dev/zero >&2; echo done"});
  REQUIRE(out == "done\n");
}

TEST_CASE("stderr is kept on failure") {
  auto e = error_of([]{ spawn("sh", {"-c", "echo partial; echo broken >&2; exit 2"}); });
  REQUIRE(e.has_value());
  REQUIRE(e->stdout_text() == "partial\n");
  REQUIRE(e->stderr_text() == "broken\n");
  REQUIRE(std::string(e->what()) ==
          "Command failed: sh -c echo partial; echo broken >&2; exit 2\nbroken\n");
}

TEST_CASE("errno and signal names") {
  REQUIRE(errno_name(ENOENT) == "ENOENT");
  REQUIRE(errno_name(EACCES) == "EACCES");
  REQUIRE(signal_name(SIGTERM) == "SIGTERM");
}
