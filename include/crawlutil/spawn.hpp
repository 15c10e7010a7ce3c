#pragma once
#include <chrono>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace crawlutil {

// Лимит по умолчанию у exec_file
constexpr std::size_t kDefaultMaxBuffer = 1024 * 1024;

struct SpawnOptions {
  std::filesystem::path cwd;
  std::unordered_map<std::string, std::string> env; // поверх текущего окружения
  std::chrono::milliseconds timeout{0};             // 0 = без таймаута
  int kill_signal = SIGTERM;
  std::optional<std::size_t> max_buffer; // nullopt = без ограничения
};

class SpawnError : public std::runtime_error {
public:
  enum class Kind { Launch, Exit, Signal, Timeout, MaxBuffer };

  struct Details {
    Kind kind = Kind::Launch;
    std::string code;
    std::optional<int> exit_code;
    std::optional<std::string> signal;
    bool killed = false;
    std::string out;
    std::string err;
  };

  SpawnError(const std::string &message, Details d)
      : std::runtime_error(message), d_(std::move(d)) {}

  Kind kind() const { return d_.kind; }
  // errno-имя (ENOENT), код выхода ("1"), ERR_CHILD_PROCESS_STDIO_MAXBUFFER или ""
  const std::string &code() const { return d_.code; }
  std::optional<int> exit_code() const { return d_.exit_code; }
  const std::optional<std::string> &signal_name() const { return d_.signal; }
  bool killed() const { return d_.killed; }
  const std::string &stdout_text() const { return d_.out; }
  const std::string &stderr_text() const { return d_.err; }

private:
  Details d_;
};

/**
 * Runs `command` (PATH lookup, no shell) and returns everything it wrote to
 * stdout. stdout and stderr are drained continuously, so output size is not
 * limited unless `opts.max_buffer` is set.
 *
 * Throws SpawnError: Launch if the program could not be executed
 * ("spawn <command> ENOENT"), Exit on a non-zero status
 * ("Command failed: <command> <args>\n<stderr>"), Signal / Timeout if the
 * child was killed, MaxBuffer if a stream outgrew `opts.max_buffer`.
 */
std::string spawn(const std::string &command,
                  const std::vector<std::string> &args,
                  const SpawnOptions &opts = {});

// То же на отдельном потоке; get() пробрасывает SpawnError
std::future<std::string> spawn_async(const std::string &command,
                                     const std::vector<std::string> &args,
                                     const SpawnOptions &opts = {});

// Buffered exec: spawn с max_buffer (kDefaultMaxBuffer, если не задан)
std::string exec_file(const std::string &command,
                      const std::vector<std::string> &args,
                      SpawnOptions opts = {});

std::string errno_name(int err);
std::string signal_name(int sig);

} // namespace crawlutil
