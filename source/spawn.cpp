#include <crawlutil/spawn.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

extern char **environ;

namespace crawlutil {

static constexpr std::size_t kChunk = 64 * 1024;

std::string errno_name(int err) {
  switch (err) {
  case ENOENT: return "ENOENT";
  case EACCES: return "EACCES";
  case EPERM: return "EPERM";
  case ENOTDIR: return "ENOTDIR";
  case EISDIR: return "EISDIR";
  case ELOOP: return "ELOOP";
  case ENAMETOOLONG: return "ENAMETOOLONG";
  case ENOEXEC: return "ENOEXEC";
  case E2BIG: return "E2BIG";
  case ENOMEM: return "ENOMEM";
  case ETXTBSY: return "ETXTBSY";
  case EMFILE: return "EMFILE";
  case ENFILE: return "ENFILE";
  case EAGAIN: return "EAGAIN";
  case EINVAL: return "EINVAL";
  case EIO: return "EIO";
  default: return fmt::format("errno {}", err);
  }
}

std::string signal_name(int sig) {
  switch (sig) {
  case SIGHUP: return "SIGHUP";
  case SIGINT: return "SIGINT";
  case SIGQUIT: return "SIGQUIT";
  case SIGILL: return "SIGILL";
  case SIGABRT: return "SIGABRT";
  case SIGBUS: return "SIGBUS";
  case SIGFPE: return "SIGFPE";
  case SIGKILL: return "SIGKILL";
  case SIGUSR1: return "SIGUSR1";
  case SIGSEGV: return "SIGSEGV";
  case SIGUSR2: return "SIGUSR2";
  case SIGPIPE: return "SIGPIPE";
  case SIGALRM: return "SIGALRM";
  case SIGTERM: return "SIGTERM";
  default: return fmt::format("SIG{}", sig);
  }
}

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
  if (::pipe(pfd) != 0) return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

static std::string command_line(const std::string &command,
                                const std::vector<std::string> &args) {
  std::string s = command;
  for (const auto &a : args) {
    s += ' ';
    s += a;
  }
  return s;
}

[[noreturn]] static void launch_failed(const std::string &command, int err) {
  SpawnError::Details d;
  d.kind = SpawnError::Kind::Launch;
  d.code = errno_name(err);
  std::string message = fmt::format("spawn {} {}", command, d.code);
  throw SpawnError(message, std::move(d));
}

// Окружение собираем до fork: в дочернем процессе только async-signal-safe вызовы
static std::vector<std::string>
build_env(const std::unordered_map<std::string, std::string> &extra) {
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e) {
    std::string kv(*e);
    auto eq = kv.find('=');
    if (eq != std::string::npos && extra.count(kv.substr(0, eq)))
      continue;
    out.push_back(std::move(kv));
  }
  for (const auto &[k, v] : extra)
    out.push_back(k + "=" + v);
  return out;
}

static std::string run_child(const std::string &command,
                             const std::vector<std::string> &args,
                             const SpawnOptions &opts) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>(command.c_str()));
  for (const auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  std::vector<char *> envp;
  if (!opts.env.empty()) {
    env_storage = build_env(opts.env);
    envp.reserve(env_storage.size() + 1);
    for (auto &kv : env_storage)
      envp.push_back(const_cast<char *>(kv.c_str()));
    envp.push_back(nullptr);
  }
  const std::string cwd = opts.cwd.string();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (make_cloexec_pipe(out_pipe) != 0 || make_cloexec_pipe(err_pipe) != 0 ||
      make_cloexec_pipe(exec_pipe) != 0) {
    int err = errno;
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    launch_failed(command, err);
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    for (int *p : {out_pipe, err_pipe, exec_pipe}) {
      close_fd(p[0]);
      close_fd(p[1]);
    }
    launch_failed(command, err);
  }

  if (pid == 0) {
    auto fail = [&](int err) {
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    };
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0)
      fail(errno);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    if (::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
        ::dup2(err_pipe[1], STDERR_FILENO) < 0)
      fail(errno);

    if (envp.empty())
      ::execvp(argv[0], argv.data());
    else
      ::execvpe(argv[0], argv.data(), envp.data());
    fail(errno);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // exec_pipe закрывается на exec (CLOEXEC); данные в нём = errno неудачного exec
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n > 0) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
    }
    spdlog::debug("[spawn] {}: exec failed: {}", command,
                  std::strerror(child_errno));
    launch_failed(command, child_errno);
  }

  spdlog::debug("[spawn] {} pid={}", command_line(command, args), pid);

  std::string out, err;
  std::array<char, kChunk> buf{};
  bool killed = false;
  const char *overflow = nullptr;
  const bool has_deadline = opts.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + opts.timeout;

  std::array<pollfd, 2> fds{};
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  std::array<std::string *, 2> sinks{&out, &err};

  while (fds[0].fd >= 0 || fds[1].fd >= 0) {
    int wait_ms = -1;
    if (has_deadline && !killed) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        spdlog::debug("[spawn] {} timed out after {}ms, sending {}", command,
                      opts.timeout.count(), signal_name(opts.kill_signal));
        ::kill(pid, opts.kill_signal);
        killed = true;
      } else {
        // poll принимает int: длинный таймаут ждём порциями
        wait_ms = static_cast<int>(std::min<long long>(
            left.count(), std::numeric_limits<int>::max()));
      }
    }

    int rc = ::poll(fds.data(), fds.size(), wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      spdlog::warn("[spawn] {}: poll failed: {}", command,
                   std::strerror(errno));
      break;
    }
    if (rc == 0)
      continue;

    for (std::size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t r = ::read(fds[i].fd, buf.data(), buf.size());
      if (r > 0) {
        sinks[i]->append(buf.data(), static_cast<std::size_t>(r));
      } else if (r == 0 || errno != EINTR) {
        close_fd(fds[i].fd);
      }
    }

    if (opts.max_buffer && !overflow) {
      if (out.size() > *opts.max_buffer)
        overflow = "stdout";
      else if (err.size() > *opts.max_buffer)
        overflow = "stderr";
      if (overflow) {
        ::kill(pid, opts.kill_signal);
        break;
      }
    }
  }
  close_fd(fds[0].fd);
  close_fd(fds[1].fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }

  spdlog::debug("[spawn] {} pid={} finished status={} stdout={}B stderr={}B",
                command, pid, status, out.size(), err.size());

  if (overflow) {
    SpawnError::Details d;
    d.kind = SpawnError::Kind::MaxBuffer;
    d.code = "ERR_CHILD_PROCESS_STDIO_MAXBUFFER";
    d.killed = true;
    d.out = std::move(out);
    d.err = std::move(err);
    throw SpawnError(fmt::format("{} maxBuffer length exceeded", overflow),
                     std::move(d));
  }

  if (WIFEXITED(status) && WEXITSTATUS(status) == 0 && !killed)
    return out;

  SpawnError::Details d;
  d.killed = killed;
  if (WIFSIGNALED(status)) {
    d.kind = killed ? SpawnError::Kind::Timeout : SpawnError::Kind::Signal;
    d.signal = signal_name(WTERMSIG(status));
  } else {
    d.kind = killed ? SpawnError::Kind::Timeout : SpawnError::Kind::Exit;
    d.exit_code = WEXITSTATUS(status);
    d.code = std::to_string(*d.exit_code);
  }
  std::string message = fmt::format("Command failed: {}\n{}",
                                    command_line(command, args), err);
  d.out = std::move(out);
  d.err = std::move(err);
  throw SpawnError(message, std::move(d));
}

std::string spawn(const std::string &command,
                  const std::vector<std::string> &args,
                  const SpawnOptions &opts) {
  return run_child(command, args, opts);
}

std::future<std::string> spawn_async(const std::string &command,
                                     const std::vector<std::string> &args,
                                     const SpawnOptions &opts) {
  return std::async(std::launch::async, [command, args, opts] {
    return run_child(command, args, opts);
  });
}

std::string exec_file(const std::string &command,
                      const std::vector<std::string> &args,
                      SpawnOptions opts) {
  if (!opts.max_buffer)
    opts.max_buffer = kDefaultMaxBuffer;
  return run_child(command, args, opts);
}

} // namespace crawlutil
