#include "clawcore/sandbox/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

extern char **environ;

namespace clawcore::sandbox {

namespace {

using Clock = std::chrono::steady_clock;

// Bytes beyond the cap are dropped as they arrive
struct CappedBuffer {
  std::string data;
  size_t cap;
  bool truncated = false;

  explicit CappedBuffer(size_t max_bytes) : cap(max_bytes) {}

  void append(const char *bytes, size_t n) {
    if (truncated) return;
    size_t room = cap - data.size();
    if (n <= room) {
      data.append(bytes, n);
    } else {
      data.append(bytes, room);
      truncated = true;
    }
  }

  std::string finish() const {
    if (!truncated) return data;
    return data.substr(0, Truncate::utf8_boundary(data, cap)) + Truncate::marker(cap);
  }
};

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// Read what is available; false once the write end is closed
bool drain(int fd, CappedBuffer &buffer) {
  std::array<char, 4096> chunk;
  while (true) {
    ssize_t n = read(fd, chunk.data(), chunk.size());
    if (n > 0) {
      buffer.append(chunk.data(), static_cast<size_t>(n));
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// KEY=VALUE strings for the child: inherited environment with overrides applied
std::vector<std::string> build_env(const std::map<std::string, std::string> &overrides) {
  std::vector<std::string> result;
  for (char **entry = environ; entry && *entry; ++entry) {
    std::string kv(*entry);
    auto eq = kv.find('=');
    if (eq != std::string::npos && overrides.count(kv.substr(0, eq))) continue;
    result.push_back(std::move(kv));
  }
  for (const auto &[key, value] : overrides) {
    result.push_back(key + "=" + value);
  }
  return result;
}

std::vector<char *> to_cstrings(std::vector<std::string> &strings) {
  std::vector<char *> result;
  result.reserve(strings.size() + 1);
  for (auto &s : strings) {
    result.push_back(s.data());
  }
  result.push_back(nullptr);
  return result;
}

SandboxedProcessResult spawn_failure(const std::string &message, int exit_code, Clock::time_point start) {
  SandboxedProcessResult result;
  result.spawn_failed = true;
  result.exit_code = exit_code;
  result.error = message;
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  spdlog::warn("[Sandbox] Spawn failed: {}", message);
  return result;
}

}  // namespace

std::vector<std::string> interpreter_for(const std::filesystem::path &script) {
  auto ext = script.extension().string();
  if (ext == ".sh") return {"bash"};
  if (ext == ".py") return {"python3"};
  if (ext == ".js") return {"node"};
  if (ext == ".ts") return {"npx", "tsx"};
  return {};
}

std::vector<std::string> script_command(const std::filesystem::path &script) {
  auto argv = interpreter_for(script);
  argv.push_back(script.string());
  return argv;
}

SandboxedProcessResult run_process(const ProcessOptions &options) {
  auto start_time = Clock::now();

  if (options.argv.empty()) {
    return spawn_failure("No command given", kExitNotFound, start_time);
  }

  // Everything the child needs is prepared before fork
  std::vector<std::string> argv_storage = options.argv;
  std::vector<std::string> env_storage = build_env(options.env);
  std::vector<char *> argv = to_cstrings(argv_storage);
  std::vector<char *> envp = to_cstrings(env_storage);
  std::string workdir = options.working_dir.string();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
    std::string message = "Failed to create pipe: " + std::string(strerror(errno));
    for (int *fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return spawn_failure(message, kExitNotExecutable, start_time);
  }

  pid_t pid = fork();
  if (pid == -1) {
    std::string message = "Failed to fork process: " + std::string(strerror(errno));
    for (int *fds : {out_pipe, err_pipe, status_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
    return spawn_failure(message, kExitNotExecutable, start_time);
  }

  if (pid == 0) {
    // ---- Child process ----
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);

    // Report {step, errno} through the CLOEXEC status pipe; nothing arrives when exec succeeds
    auto report = [&](int step, int err) {
      int data[2] = {step, err};
      ssize_t ignored = write(status_pipe[1], data, sizeof(data));
      (void)ignored;
      _exit(err == ENOENT || err == ENOTDIR ? kExitNotFound : kExitNotExecutable);
    };

    if (!workdir.empty() && chdir(workdir.c_str()) != 0) {
      report(0, errno);
    }

    environ = envp.data();
    execvp(argv[0], argv.data());
    report(1, errno);
    _exit(kExitNotExecutable);
  }

  // ---- Parent process ----
  setpgid(pid, pid);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  int child_report[2] = {0, 0};
  ssize_t status_bytes;
  do {
    status_bytes = read(status_pipe[0], child_report, sizeof(child_report));
  } while (status_bytes == -1 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (status_bytes == sizeof(child_report)) {
    int status = 0;
    waitpid(pid, &status, 0);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    std::string message = child_report[0] == 0 ? "Cannot enter working directory " + workdir : "Cannot execute " + options.argv[0];
    return spawn_failure(message + ": " + strerror(child_report[1]), decode_status(status), start_time);
  }

  spdlog::debug("[Sandbox] Spawned pid {}: {}", pid, options.argv[0]);

  fcntl(out_pipe[0], F_SETFL, fcntl(out_pipe[0], F_GETFL, 0) | O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, fcntl(err_pipe[0], F_GETFL, 0) | O_NONBLOCK);

  CappedBuffer out(options.max_output_bytes);
  CappedBuffer err(options.max_output_bytes);

  SandboxedProcessResult result;
  bool exited = false;
  int status = 0;
  std::optional<Clock::time_point> term_sent;

  // Single supervision loop: pipes, exit, timeout, abort
  while (true) {
    std::array<pollfd, 2> fds{};
    nfds_t nfds = 0;
    if (out_pipe[0] >= 0) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (err_pipe[0] >= 0) fds[nfds++] = {err_pipe[0], POLLIN, 0};

    if (nfds > 0) {
      poll(fds.data(), nfds, 20);
    } else if (!exited) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (out_pipe[0] >= 0 && !drain(out_pipe[0], out)) close_fd(out_pipe[0]);
    if (err_pipe[0] >= 0 && !drain(err_pipe[0], err)) close_fd(err_pipe[0]);

    if (!exited) {
      pid_t ret = waitpid(pid, &status, WNOHANG);
      if (ret == pid) {
        exited = true;
      } else if (ret == -1 && errno != EINTR) {
        spdlog::error("[Sandbox] waitpid failed for pid {}: {}", pid, strerror(errno));
        exited = true;
        status = 0;
      }
    }

    if (exited) {
      // Background descendants may still hold the pipes; take what is buffered and stop
      if (out_pipe[0] >= 0) drain(out_pipe[0], out);
      if (err_pipe[0] >= 0) drain(err_pipe[0], err);
      break;
    }

    if (options.abort_signal && options.abort_signal->load() && !result.cancelled) {
      spdlog::warn("[Sandbox] Cancelled, killing process group {}", pid);
      result.cancelled = true;
      result.killed = true;
      kill(-pid, SIGKILL);
      continue;
    }

    auto now = Clock::now();
    if (!result.timed_out && !result.cancelled && now - start_time >= options.timeout) {
      spdlog::warn("[Sandbox] Timed out after {}ms, sending SIGTERM to process group {}", options.timeout.count(), pid);
      result.timed_out = true;
      result.killed = true;
      term_sent = now;
      kill(-pid, SIGTERM);
    } else if (term_sent && now - *term_sent >= options.kill_grace) {
      spdlog::warn("[Sandbox] Process group {} ignored SIGTERM, sending SIGKILL", pid);
      kill(-pid, SIGKILL);
      term_sent.reset();
    }
  }

  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  // Descendants left in the group do not outlive a killed run
  if (result.killed) {
    kill(-pid, SIGKILL);
  }

  result.output = out.finish();
  result.error = err.finish();
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_time);

  if (result.cancelled) {
    result.exit_code = kExitCancelled;
  } else if (result.timed_out) {
    result.exit_code = kExitTimeout;
  } else {
    result.exit_code = decode_status(status);
  }
  result.success = !result.killed && result.exit_code == 0;

  spdlog::debug("[Sandbox] pid {} finished: exit={}, duration={}ms, stdout={}B, stderr={}B", pid, result.exit_code, result.duration.count(),
                result.output.size(), result.error.size());
  return result;
}

std::future<SandboxedProcessResult> run_process_async(ProcessOptions options) {
  return std::async(std::launch::async, [options = std::move(options)]() { return run_process(options); });
}

}  // namespace clawcore::sandbox
