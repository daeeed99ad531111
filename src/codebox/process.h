#ifndef CODEBOX_PROCESS_H_
#define CODEBOX_PROCESS_H_

#include <string>
#include <vector>
#include <filesystem>
#include <sys/types.h>

enum class Stream { STDOUT, STDERR };

// One child process in its own process group, with piped stdio.
// Not thread-safe: only the owning session's worker thread touches it.
class ChildProcess {
  pid_t pid_;
  int stdin_fd_, stdout_fd_, stderr_fd_;
  bool reaped_;
  int status_;
  std::string pending_stdin_; // written as the pipe accepts it

  int& Fd_(Stream s) { return s == Stream::STDOUT ? stdout_fd_ : stderr_fd_; }
 public:
  ChildProcess();
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  // kills the group and reaps if still needed
  ~ChildProcess();

  // argv is executed directly (no shell) with workdir as cwd.
  // Returns false if the pipes, fork or the exec itself failed; the reason is logged.
  bool Spawn(const std::vector<std::string>& argv, const std::filesystem::path& workdir, bool with_stdin);

  pid_t Pid() const { return pid_; }
  // -1 once the stream reached EOF
  int Fd(Stream s) const { return s == Stream::STDOUT ? stdout_fd_ : stderr_fd_; }
  int StdinFd() const { return stdin_fd_; }

  // >0: bytes appended to out; 0: EOF (fd closed); -1: nothing available right now
  long Read(Stream, std::string& out);
  // Appends "text\n" to the stdin queue and writes as much as possible without blocking
  bool WriteLine(const std::string& text);
  bool HasPendingStdin() const { return !pending_stdin_.empty(); }
  bool FlushStdin();
  void CloseStdin();

  // Does not reap: the zombie leader keeps the process group id from being reused
  bool HasExited();
  void KillGroup();
  // Blocking; returns the wait status
  int Reap();
};

#endif  // CODEBOX_PROCESS_H_
