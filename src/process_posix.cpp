#include "switchover/process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

extern char** environ;

namespace switchover {

namespace {
void append_limited(std::string &dst, const char *src, ssize_t n,
                    std::size_t limit, bool &truncated) {
  if (n <= 0)
    return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) {
    truncated = true;
  }
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

bool is_executable(const std::string &path) {
  return ::access(path.c_str(), X_OK) == 0;
}
} // namespace

std::string ProcessResult::describe() const {
  if (!error_message.empty())
    return error_message;
  std::string out = timed_out ? "timed out" : "exit " + std::to_string(exit_code);
  const std::string err = trim(stderr_text);
  if (!err.empty())
    out += ": " + err;
  return out;
}

std::optional<std::string> resolve_executable(const std::string &name) {
  if (name.empty())
    return std::nullopt;
  if (name.find('/') != std::string::npos) {
    if (is_executable(name))
      return name;
    return std::nullopt;
  }
  const char *path = std::getenv("PATH");
  std::stringstream dirs(path && path[0] ? path : "/usr/local/bin:/usr/bin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty())
      continue;
    const std::string candidate = dir + "/" + name;
    if (is_executable(candidate))
      return candidate;
  }
  return std::nullopt;
}

std::string command_line(const ProcessSpec &spec) {
  std::string out = spec.command;
  for (const auto &a : spec.argv)
    out += " " + a;
  return out;
}

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  const auto resolved = resolve_executable(spec.command);
  if (!resolved) {
    result.error_message = "spawn_failed: command not found: " + spec.command;
    result.exit_code = 127;
    return result;
  }

  int out_pipe[2];
  int err_pipe[2];
  if (pipe(out_pipe) != 0) {
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    return result;
  }
  if (pipe(err_pipe) != 0) {
    result.error_message = std::string("spawn_failed: pipe: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    return result;
  }

  // Everything the child needs is built before fork().
  std::vector<std::string> all = {*resolved};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all)
    argv.push_back(s.data());
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    result.error_message = std::string("spawn_failed: fork: ") + std::strerror(errno);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    setsid();
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    execve(argv[0], argv.data(), environ);
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(spec.timeout_ms);
  char buf[4096];
  int status = 0;
  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
    n = read(err_pipe[0], buf, sizeof(buf));
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid)
      break;
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  while (true) {
    ssize_t n = read(out_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stdout_text, buf, n, spec.max_output_bytes,
                   result.stdout_truncated);
  }
  while (true) {
    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n <= 0)
      break;
    append_limited(result.stderr_text, buf, n, spec.max_output_bytes,
                   result.stderr_truncated);
  }
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = 124;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace switchover
