// Repository: MediaRelay
// Component: Subprocess Runner
// Purpose: posix_spawn-based process launch with line streaming and
//          cooperative interruption.
// Copyright (c) 2025 MediaRelay

#include "mediarelay/util/Subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mediarelay::util {

namespace {

// RAII for posix_spawn_file_actions_t.
class SpawnFileActions {
 public:
  SpawnFileActions() { ok_ = posix_spawn_file_actions_init(&actions_) == 0; }
  ~SpawnFileActions() {
    if (ok_) posix_spawn_file_actions_destroy(&actions_);
  }
  SpawnFileActions(const SpawnFileActions&) = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  bool ok() const { return ok_; }
  posix_spawn_file_actions_t* get() { return &actions_; }

 private:
  posix_spawn_file_actions_t actions_;
  bool ok_ = false;
};

bool InterruptRaised(const ProcessOptions& options) {
  return options.interrupt != nullptr &&
         options.interrupt->load(std::memory_order_acquire);
}

// Blocks until the child exits. After SIGTERM, escalates to SIGKILL once the
// grace period has elapsed.
int ReapChild(pid_t pid, const ProcessOptions& options, bool* interrupted) {
  int status = 0;
  // If SIGTERM went out while draining output, the grace period starts here.
  auto term_sent_at = std::chrono::steady_clock::now();
  bool kill_sent = false;
  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r < 0 && errno != EINTR) return -1;

    if (!*interrupted && InterruptRaised(options)) {
      *interrupted = true;
      kill(pid, SIGTERM);
      term_sent_at = std::chrono::steady_clock::now();
    } else if (*interrupted && !kill_sent &&
               std::chrono::steady_clock::now() - term_sent_at >=
                   std::chrono::milliseconds(kKillGraceMs)) {
      kill(pid, SIGKILL);
      kill_sent = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  return -1;
}

void DrainPipe(int fd, pid_t pid, const ProcessOptions& options, bool* interrupted) {
  std::string pending;
  char buf[4096];
  while (true) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int pr = poll(&pfd, 1, 100);
    if (pr < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (!*interrupted && InterruptRaised(options)) {
      *interrupted = true;
      kill(pid, SIGTERM);
    }
    if (pr == 0) continue;

    ssize_t n = read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (n == 0) break;  // EOF: child closed its end
    pending.append(buf, static_cast<size_t>(n));
    size_t nl;
    while ((nl = pending.find('\n')) != std::string::npos) {
      std::string line = pending.substr(0, nl);
      if (!line.empty() && line.back() == '\r') line.pop_back();
      options.on_line(line);
      pending.erase(0, nl + 1);
    }
  }
  if (!pending.empty()) options.on_line(pending);
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const ProcessOptions& options) {
  ProcessResult result;
  if (argv.empty() || argv[0].empty()) {
    result.error = "empty argv";
    return result;
  }
  if (InterruptRaised(options)) {
    result.interrupted = true;
    result.error = "interrupted before launch";
    return result;
  }

  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  SpawnFileActions actions;
  if (!actions.ok()) {
    result.error = "posix_spawn_file_actions_init failed";
    return result;
  }

  int fds[2] = {-1, -1};
  const bool stream = static_cast<bool>(options.on_line);
  posix_spawn_file_actions_addopen(actions.get(), 0, "/dev/null", O_RDONLY, 0);
  if (stream) {
    // O_CLOEXEC keeps this pipe out of children spawned by other threads.
    if (pipe2(fds, O_CLOEXEC) != 0) {
      result.error = std::string("pipe2 failed: ") + std::strerror(errno);
      return result;
    }
    posix_spawn_file_actions_adddup2(actions.get(), fds[1], 1);
    posix_spawn_file_actions_adddup2(actions.get(), fds[1], 2);
  } else {
    posix_spawn_file_actions_addopen(actions.get(), 1, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), 1, 2);
  }

  pid_t pid = -1;
  int rc = posix_spawnp(&pid, cargv[0], actions.get(), nullptr, cargv.data(), environ);
  if (stream) close(fds[1]);
  if (rc != 0) {
    if (stream) close(fds[0]);
    result.error = "spawn " + argv[0] + " failed: " + std::strerror(rc);
    return result;
  }
  result.launched = true;

  bool interrupted = false;
  if (stream) {
    DrainPipe(fds[0], pid, options, &interrupted);
    close(fds[0]);
  }
  result.exit_code = ReapChild(pid, options, &interrupted);
  result.interrupted = interrupted;
  return result;
}

}  // namespace mediarelay::util
