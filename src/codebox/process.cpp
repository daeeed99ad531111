#include "process.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cstring>
#include <cstdlib>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr size_t kReadChunk = 4096;
constexpr char kDefaultPath[] = "/usr/local/bin:/usr/bin:/bin";

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

std::vector<std::string> ChildEnvironment(const std::filesystem::path& workdir) {
  const char* path = getenv("PATH");
  return {
    std::string("PATH=") + (path ? path : kDefaultPath),
    "HOME=" + workdir.string(),
    "TMPDIR=" + workdir.string(),
    "LANG=C.UTF-8",
    "PYTHONUNBUFFERED=1",
    "PYTHONDONTWRITEBYTECODE=1",
  };
}

} // namespace

ChildProcess::ChildProcess() :
    pid_(-1), stdin_fd_(-1), stdout_fd_(-1), stderr_fd_(-1),
    reaped_(false), status_(0) {}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    KillGroup();
    Reap();
  }
  CloseFd(stdin_fd_);
  CloseFd(stdout_fd_);
  CloseFd(stderr_fd_);
}

bool ChildProcess::Spawn(const std::vector<std::string>& argv, const std::filesystem::path& workdir, bool with_stdin) {
  if (argv.empty() || pid_ > 0) return false;
  // everything the child touches is prepared here; after fork() it only makes
  //   async-signal-safe calls
  std::vector<std::string> env = ChildEnvironment(workdir);
  std::vector<char*> c_argv, c_env;
  for (auto& i : argv) c_argv.push_back(const_cast<char*>(i.c_str()));
  c_argv.push_back(nullptr);
  for (auto& i : env) c_env.push_back(i.data());
  c_env.push_back(nullptr);
  std::string dir = workdir.string();

  // all close-on-exec, so concurrent sessions never inherit each other's pipes
  int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  auto CloseAll = [&]() {
    for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) CloseFd(p[0]), CloseFd(p[1]);
  };
  if (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(exec_pipe, O_CLOEXEC) < 0 ||
      (with_stdin ? pipe2(in_pipe, O_CLOEXEC) : (in_pipe[0] = open("/dev/null", O_RDONLY | O_CLOEXEC))) < 0) {
    spdlog::warn("Failed creating pipes: {}", strerror(errno));
    CloseAll();
    return false;
  }
  struct sigaction dfl_action = {};
  dfl_action.sa_handler = SIG_DFL;
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  struct rlimit no_core = {0, 0};

  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed forking for {}: {}", argv[0], strerror(errno));
    CloseAll();
    return false;
  }
  if (pid == 0) {
    setpgid(0, 0);
    // dup2 clears close-on-exec on the target descriptor only
    if (dup2(in_pipe[0], 0) < 0 || dup2(out_pipe[1], 1) < 0 || dup2(err_pipe[1], 2) < 0) {
      int err = errno;
      IGNORE_RETURN(write(exec_pipe[1], &err, sizeof(err)));
      _exit(127);
    }
    // ignored signals survive execve; the server ignores SIGPIPE
    sigaction(SIGPIPE, &dfl_action, nullptr);
    sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
    setrlimit(RLIMIT_CORE, &no_core);
    if (chdir(dir.c_str()) == 0) execve(c_argv[0], c_argv.data(), c_env.data());
    int err = errno;
    IGNORE_RETURN(write(exec_pipe[1], &err, sizeof(err)));
    _exit(127);
  }
  // also set from the parent so KillGroup is valid even before the child runs
  setpgid(pid, pid);
  pid_ = pid;
  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);
  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);
  stdin_fd_ = in_pipe[1];
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];
  if (n > 0) {
    spdlog::warn("Failed executing {} in {}: {}", fmt::format("{}", argv), dir, strerror(exec_errno));
    Reap();
    CloseFd(stdin_fd_);
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    return false;
  }
  if (!SetNonBlocking(stdout_fd_) || !SetNonBlocking(stderr_fd_) ||
      (stdin_fd_ >= 0 && !SetNonBlocking(stdin_fd_))) {
    KillGroup();
    Reap();
    return false;
  }
  spdlog::debug("Spawned pid={} command={} workdir={}", pid_, fmt::format("{}", argv), dir);
  return true;
}

long ChildProcess::Read(Stream s, std::string& out) {
  int& fd = Fd_(s);
  if (fd < 0) return 0;
  char buf[kReadChunk];
  ssize_t n;
  do {
    n = read(fd, buf, sizeof(buf));
  } while (n < 0 && errno == EINTR);
  if (n > 0) {
    out.append(buf, n);
    return n;
  }
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return -1;
  if (n < 0) spdlog::warn("Failed reading from pid={}: {}", pid_, strerror(errno));
  CloseFd(fd);
  return 0;
}

bool ChildProcess::WriteLine(const std::string& text) {
  if (stdin_fd_ < 0) return false;
  pending_stdin_ += text;
  pending_stdin_ += '\n';
  return FlushStdin();
}

bool ChildProcess::FlushStdin() {
  while (stdin_fd_ >= 0 && !pending_stdin_.empty()) {
    ssize_t n = write(stdin_fd_, pending_stdin_.data(), pending_stdin_.size());
    if (n > 0) {
      pending_stdin_.erase(0, n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    // EPIPE: the program closed its stdin or is exiting; its exit status tells the rest
    spdlog::debug("Stdin of pid={} closed: {}", pid_, strerror(errno));
    pending_stdin_.clear();
    CloseStdin();
    return false;
  }
  return stdin_fd_ >= 0;
}

void ChildProcess::CloseStdin() {
  CloseFd(stdin_fd_);
}

bool ChildProcess::HasExited() {
  if (pid_ <= 0 || reaped_) return true;
  siginfo_t info = {};
  if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
    if (errno == EINTR) return false;
    spdlog::warn("waitid pid={} failed: {}", pid_, strerror(errno));
    return true;
  }
  return info.si_pid == pid_;
}

void ChildProcess::KillGroup() {
  if (pid_ <= 0 || reaped_) return;
  // the leader is not reaped yet, so -pid_ still names this group
  if (kill(-pid_, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pid_, strerror(errno));
  }
}

int ChildProcess::Reap() {
  if (pid_ <= 0 || reaped_) return status_;
  while (waitpid(pid_, &status_, 0) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("waitpid pid={} failed: {}", pid_, strerror(errno));
    status_ = 0;
    break;
  }
  reaped_ = true;
  spdlog::debug("Reaped pid={} status={:#x}", pid_, status_);
  return status_;
}
