#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

inline long ElapsedUs(Clock::time_point start, Clock::time_point end) {
  return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
}

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

void ClosePipes(int (&pipes)[3][2]) {
  for (auto& i : pipes) CloseFd(i[0]), CloseFd(i[1]);
}

// runs in the forked child; only async-signal-safe calls
[[noreturn]] void ExecChild(char* const* argv, const char* workdir, int out_fd, int err_fd, int report_fd) {
  struct sigaction act{};
  act.sa_handler = SIG_DFL;
  sigaction(SIGPIPE, &act, nullptr);
  setpgid(0, 0);
  if (int null_fd = open("/dev/null", O_RDONLY); null_fd >= 0) dup2(null_fd, 0);
  dup2(out_fd, 1);
  dup2(err_fd, 2);
  if (!workdir || chdir(workdir) == 0) execvp(argv[0], argv);
  int err = errno;
  IGNORE_RETURN(write(report_fd, &err, sizeof(err)));
  _exit(127);
}

class LineSplitter {
  const std::function<void(const std::string&)>& callback_;
  std::string buf_;
 public:
  explicit LineSplitter(const std::function<void(const std::string&)>& callback) : callback_(callback) {}
  void Feed(const char* data, size_t len) {
    if (!callback_) return;
    buf_.append(data, len);
    size_t start = 0;
    for (size_t pos; (pos = buf_.find('\n', start)) != std::string::npos; start = pos + 1) {
      callback_(buf_.substr(start, pos - start));
    }
    buf_.erase(0, start);
  }
  void Flush() {
    if (callback_ && !buf_.empty()) callback_(buf_);
    buf_.clear();
  }
};

} // namespace

std::string CommandToString(const std::vector<std::string>& command) {
  return fmt::format("{}", fmt::join(command, " "));
}

ProcessResult RunProcess(const ProcessOptions& opt) {
  ProcessResult ret;
  if (opt.command.empty()) {
    ret.spawn_error = "Empty command";
    return ret;
  }
  // prepare everything before fork
  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  std::string workdir = opt.workdir.string();

  // stdout, stderr, exec error report
  int pipes[3][2] = {{-1, -1}, {-1, -1}, {-1, -1}};
  if (pipe2(pipes[0], O_CLOEXEC) < 0 ||
      (!opt.merge_error && pipe2(pipes[1], O_CLOEXEC) < 0) ||
      pipe2(pipes[2], O_CLOEXEC) < 0) {
    ret.spawn_error = fmt::format("Failed to create pipes: {}", strerror(errno));
    ClosePipes(pipes);
    return ret;
  }
  spdlog::debug("Run command: {} (workdir={}, time_limit={}us)",
                CommandToString(opt.command), workdir, opt.time_limit);

  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    ret.spawn_error = fmt::format("Failed to fork: {}", strerror(errno));
    ClosePipes(pipes);
    return ret;
  }
  if (pid == 0) {
    ExecChild(argv.data(), workdir.empty() ? nullptr : workdir.c_str(),
              pipes[0][1], opt.merge_error ? pipes[0][1] : pipes[1][1], pipes[2][1]);
  }
  setpgid(pid, pid); // also done in the child; whichever comes first
  CloseFd(pipes[0][1]);
  CloseFd(pipes[1][1]);
  CloseFd(pipes[2][1]);

  {
    // the report pipe is closed on a successful exec
    int err = 0;
    ssize_t len;
    while ((len = read(pipes[2][0], &err, sizeof(err))) < 0 && errno == EINTR);
    CloseFd(pipes[2][0]);
    if (len == (ssize_t)sizeof(err)) {
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      ret.spawn_error = fmt::format("Failed to execute {}: {}", opt.command[0], strerror(err));
      spdlog::debug("{}", ret.spawn_error);
      ClosePipes(pipes);
      return ret;
    }
  }
  ret.started = true;

  LineSplitter splitter(opt.on_output_line);
  auto deadline = start + std::chrono::microseconds(opt.time_limit);
  struct pollfd fds[2];
  std::string* sinks[2] = {&ret.output, &ret.error};
  while (pipes[0][0] >= 0 || pipes[1][0] >= 0) {
    int timeout_ms = -1;
    if (opt.time_limit > 0) {
      auto now = Clock::now();
      if (now >= deadline) {
        ret.timed_out = true;
        break;
      }
      timeout_ms = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
    }
    int nfds = 0, which[2];
    for (int i = 0; i < 2; i++) {
      if (pipes[i][0] < 0) continue;
      fds[nfds] = {pipes[i][0], POLLIN, 0};
      which[nfds++] = i;
    }
    int res = poll(fds, nfds, timeout_ms);
    if (res < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll error: {}", strerror(errno));
      break;
    }
    for (int i = 0; i < nfds; i++) {
      if (!fds[i].revents) continue;
      char buf[65536];
      ssize_t len = read(fds[i].fd, buf, sizeof(buf));
      if (len < 0 && errno == EINTR) continue;
      if (len <= 0) {
        CloseFd(pipes[which[i]][0]);
        continue;
      }
      if (opt.max_output > 0) {
        size_t used = ret.output.size() + ret.error.size();
        if (used + len > (size_t)opt.max_output) {
          len = (size_t)opt.max_output - used;
          ret.output_exceeded = true;
        }
      }
      sinks[which[i]]->append(buf, len);
      if (which[i] == 0) splitter.Feed(buf, len);
      if (ret.output_exceeded) break;
    }
    if (ret.output_exceeded) break;
  }
  splitter.Flush();

  // the pipes may be closed long before the exit; keep enforcing the deadline
  // without reaping so the process group cannot be reused before it is cleared
  siginfo_t info{};
  if (!ret.timed_out && !ret.output_exceeded && opt.time_limit > 0) {
    while (true) {
      info.si_pid = 0;
      if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        if (errno == EINTR) continue;
        break;
      }
      if (info.si_pid == pid) break;
      auto now = Clock::now();
      if (now >= deadline) {
        ret.timed_out = true;
        break;
      }
      auto wait = std::min<Clock::duration>(deadline - now, std::chrono::milliseconds(10));
      std::this_thread::sleep_for(wait);
    }
  }
  if (ret.timed_out || ret.output_exceeded) {
    spdlog::debug("Command {} {}, killing process group {}", opt.command[0],
                  ret.timed_out ? "timed out" : "exceeded output limit", pid);
    kill(-pid, SIGKILL);
  }
  while (waitid(P_PID, pid, &info, WEXITED | WNOWAIT) < 0 && errno == EINTR);
  ret.elapsed = ElapsedUs(start, Clock::now());
  kill(-pid, SIGKILL); // leftover children
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  ClosePipes(pipes);

  if (WIFEXITED(status)) {
    ret.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
  }
  spdlog::debug("Command {} finished: exit_code={} signal={} timed_out={} output_exceeded={} elapsed={}us",
                opt.command[0], ret.exit_code, ret.signal, ret.timed_out, ret.output_exceeded, ret.elapsed);
  return ret;
}
