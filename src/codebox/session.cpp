#include "session.h"

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <algorithm>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codebox/analysis.h>
#include "utils.h"

namespace {

using Clock = ExecutionSession::Clock;
using std::chrono::milliseconds;

constexpr size_t kMaxMessage = 4000;
// bytes taken from one pipe per loop iteration, so limits are checked while a program floods
constexpr size_t kReadBudget = 64 * 1024;
// exit detection does not rely on EOF (a grandchild may hold the pipes), so poll never sleeps longer
constexpr long kPollSliceMs = 50;
// how long callers wait past the deadline for the worker to tear a session down
constexpr milliseconds kTeardownGrace(2000);

long MsUntil(Clock::time_point now, Clock::time_point t) {
  if (t <= now) return 0;
  return std::chrono::ceil<milliseconds>(t - now).count();
}

// Returns whether anything arrived
bool ReadAvailable(ChildProcess& proc, Stream s, std::string& out) {
  size_t start = out.size();
  while (out.size() - start < kReadBudget && proc.Read(s, out) > 0);
  return out.size() > start;
}

std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) return fmt::format("exited with status {}", WEXITSTATUS(status));
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    return fmt::format("killed by signal {} ({})", sig, strsignal(sig));
  }
  return fmt::format("ended with wait status {:#x}", status);
}

int ExitCode(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::string LastLine(const std::string& str) {
  size_t end = str.find_last_not_of("\r\n");
  if (end == std::string::npos) return "";
  size_t begin = str.rfind('\n', end);
  begin = begin == std::string::npos ? 0 : begin + 1;
  return str.substr(begin, end + 1 - begin);
}

std::string StopMessage(ErrorKind kind) {
  if (kind == ErrorKind::TIMEOUT) return fmt::format("Execution timed out after {} ms", kTimeoutMs);
  if (kind == ErrorKind::CANCELLED) return "Execution stopped by request";
  return "";
}

} // namespace

ExecutionSession::ExecutionSession(const std::string& id, const ExecutionRequest& req) :
    id_(id), lang_(req.lang), deadline_(Clock::now() + milliseconds(kTimeoutMs)),
    code_(req.code), expected_output_(req.expected_output),
    state_(SessionState::CREATED), inputs_(req.inputs.begin(), req.inputs.end()),
    delivered_(0), stop_requested_(false), expire_requested_(false),
    finished_(false), result_delivered_(false), wake_pipe_{-1, -1} {
  if (pipe2(wake_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
    spdlog::warn("Failed creating wake pipe for session {}: {}", id_, strerror(errno));
    wake_pipe_[0] = wake_pipe_[1] = -1;
  }
}

ExecutionSession::~ExecutionSession() {
  if (worker_.joinable()) {
    {
      std::lock_guard lck(mtx_);
      if (!finished_) stop_requested_ = true;
    }
    Wake_();
    worker_.join();
  }
  for (int fd : wake_pipe_) {
    if (fd >= 0) close(fd);
  }
}

void ExecutionSession::Start() {
  worker_ = std::thread(&ExecutionSession::Run_, this);
}

bool ExecutionSession::PushInput(std::string&& input) {
  {
    std::lock_guard lck(mtx_);
    if (IsTerminal(state_)) return false;
    inputs_.push_back(std::move(input));
  }
  Wake_();
  return true;
}

void ExecutionSession::Stop() {
  {
    std::lock_guard lck(mtx_);
    if (IsTerminal(state_)) return;
    stop_requested_ = true;
  }
  Wake_();
  std::unique_lock lck(mtx_);
  cv_.wait_until(lck, deadline_ + kTeardownGrace, [this]() { return IsTerminal(state_); });
}

void ExecutionSession::Expire() {
  {
    std::lock_guard lck(mtx_);
    if (IsTerminal(state_)) return;
    expire_requested_ = true;
  }
  Wake_();
}

SessionReply ExecutionSession::Wait(long max_wait_ms, bool return_on_output) {
  std::unique_lock lck(mtx_);
  auto limit = deadline_ + kTeardownGrace;
  if (max_wait_ms >= 0) limit = std::min(limit, Clock::now() + milliseconds(max_wait_ms));
  cv_.wait_until(lck, limit, [&]() {
    if (IsTerminal(state_)) return true;
    if (return_on_output && output_.size() > delivered_) return true;
    return inputs_.empty() && state_ == SessionState::AWAITING_INPUT;
  });
  return Snapshot_();
}

SessionReply ExecutionSession::WaitTerminal() {
  std::unique_lock lck(mtx_);
  auto limit = deadline_ + kTeardownGrace;
  while (!cv_.wait_until(lck, limit, [this]() { return IsTerminal(state_); })) {
    spdlog::warn("Session {} still {} past its deadline", id_, SessionStateName(state_));
    expire_requested_ = true;
    lck.unlock();
    Wake_();
    lck.lock();
    limit += kTeardownGrace;
  }
  return Snapshot_();
}

bool ExecutionSession::Terminal() {
  std::lock_guard lck(mtx_);
  return IsTerminal(state_);
}

bool ExecutionSession::ResultDelivered() {
  std::lock_guard lck(mtx_);
  return result_delivered_;
}

ExecutionSession::Clock::time_point ExecutionSession::FinishedAt() {
  std::lock_guard lck(mtx_);
  return finished_at_;
}

void ExecutionSession::Wake_() {
  if (wake_pipe_[1] < 0) return;
  char c = 0;
  // EAGAIN: a wakeup is already pending
  IGNORE_RETURN(write(wake_pipe_[1], &c, 1));
}

void ExecutionSession::DrainWake_() {
  char buf[64];
  while (read(wake_pipe_[0], buf, sizeof(buf)) > 0);
}

void ExecutionSession::SetState_(SessionState state) {
  if (state_ == state) return;
  spdlog::debug("Session {}: {} -> {}", id_, SessionStateName(state_), SessionStateName(state));
  state_ = state;
  cv_.notify_all();
}

SessionReply ExecutionSession::Snapshot_() {
  SessionReply reply;
  reply.found = true;
  reply.session_id = id_;
  reply.state = state_;
  reply.output_delta = output_.substr(delivered_);
  delivered_ = output_.size();
  if (IsTerminal(state_)) {
    reply.error = result_.error;
    reply.message = result_.message;
    reply.result = result_;
    result_delivered_ = true;
  }
  return reply;
}

ErrorKind ExecutionSession::PendingStop_(Clock::time_point now) const {
  if (stop_requested_) return ErrorKind::CANCELLED;
  if (expire_requested_ || now >= deadline_) return ErrorKind::TIMEOUT;
  return ErrorKind::NONE;
}

void ExecutionSession::Run_() {
  const LanguageProfile& profile = ResolveProfile(lang_);
  spdlog::info("Session {} started: lang={} code={} bytes", id_, LanguageName(lang_), code_.size());
  if (wake_pipe_[0] < 0) {
    Finish_(ErrorKind::SANDBOX_ERROR, "");
    return;
  }
  sandbox_ = Sandbox::Acquire(id_);
  if (!sandbox_ || !sandbox_->WriteFile(profile.source_name, code_)) {
    Finish_(ErrorKind::SANDBOX_ERROR, "");
    return;
  }
  code_.clear();
  code_.shrink_to_fit();
  if (profile.HasCompileStep() && !Compile_()) return;
  RunProgram_();
}

// Returns false if the session already finished
bool ExecutionSession::Compile_() {
  const LanguageProfile& profile = ResolveProfile(lang_);
  {
    std::lock_guard lck(mtx_);
    SetState_(SessionState::COMPILING);
  }
  auto slice_end = std::min(deadline_, Clock::now() + milliseconds(kCompileTimeoutMs));
  ChildProcess compiler;
  if (!compiler.Spawn(profile.compile_command, sandbox_->Path(), false)) {
    Finish_(ErrorKind::SANDBOX_ERROR, "");
    return false;
  }
  // the compiler must be gone before Finish_ deletes its working directory
  auto Abort = [&](ErrorKind kind, std::string&& message) {
    compiler.KillGroup();
    compiler.Reap();
    Finish_(kind, std::move(message));
    return false;
  };
  std::string out, err;
  while (true) {
    auto now = Clock::now();
    ErrorKind stop;
    {
      std::lock_guard lck(mtx_);
      stop = PendingStop_(now);
    }
    if (stop != ErrorKind::NONE) return Abort(stop, StopMessage(stop));
    if (now >= slice_end) {
      return Abort(ErrorKind::COMPILE_ERROR, fmt::format("Compilation timed out after {} ms", kCompileTimeoutMs));
    }
    pollfd fds[3] = {
      {compiler.Fd(Stream::STDOUT), POLLIN, 0},
      {compiler.Fd(Stream::STDERR), POLLIN, 0},
      {wake_pipe_[0], POLLIN, 0},
    };
    if (poll(fds, 3, std::min(kPollSliceMs, MsUntil(now, slice_end))) < 0 && errno != EINTR) {
      spdlog::warn("poll failed in session {}: {}", id_, strerror(errno));
      return Abort(ErrorKind::SANDBOX_ERROR, "");
    }
    DrainWake_();
    // diagnostics beyond a few messages' worth are dropped, not buffered
    std::string chunk;
    if (ReadAvailable(compiler, Stream::STDOUT, chunk) && out.size() < kMaxMessage * 4) out += chunk;
    chunk.clear();
    if (ReadAvailable(compiler, Stream::STDERR, chunk) && err.size() < kMaxMessage * 4) err += chunk;
    if (compiler.HasExited()) break;
  }
  compiler.KillGroup();
  ReadAvailable(compiler, Stream::STDOUT, out);
  ReadAvailable(compiler, Stream::STDERR, err);
  int status = compiler.Reap();
  spdlog::debug("Session {} compiler {}", id_, DescribeStatus(status));
  if (status != 0 || !err.empty() || !sandbox_->Exists(profile.artifact_name)) {
    std::string msg = out + err;
    if (msg.empty()) msg = "Compiler " + DescribeStatus(status);
    Finish_(ErrorKind::COMPILE_ERROR, TruncateMessage(std::move(msg), kMaxMessage));
    return false;
  }
  return true;
}

void ExecutionSession::RunProgram_() {
  const LanguageProfile& profile = ResolveProfile(lang_);
  auto proc = std::make_unique<ChildProcess>();
  if (!proc->Spawn(profile.run_command, sandbox_->Path(), true)) {
    Finish_(ErrorKind::SANDBOX_ERROR, "");
    return;
  }
  ChildProcess* child = proc.get();
  {
    std::lock_guard lck(mtx_);
    process_ = std::move(proc);
    SetState_(SessionState::RUNNING);
  }
  const size_t output_limit = kMaxOutput * 1024;
  auto last_activity = Clock::now();
  while (true) {
    auto now = Clock::now();
    ErrorKind stop;
    long window;
    bool awaiting;
    {
      std::lock_guard lck(mtx_);
      stop = PendingStop_(now);
      if (stop == ErrorKind::NONE && state_ == SessionState::AWAITING_INPUT && !inputs_.empty()) {
        // inputs are only ever written once the program is blocked on stdin
        std::string line = std::move(inputs_.front());
        inputs_.pop_front();
        spdlog::debug("Session {} writing input of {} bytes", id_, line.size());
        child->WriteLine(line);
        SetState_(SessionState::RUNNING);
        last_activity = now;
      }
      awaiting = state_ == SessionState::AWAITING_INPUT;
      bool prompt = kPromptHeuristic && !output_.empty() && output_.back() != '\n';
      window = prompt ? std::min(kPromptQuiescenceMs, kQuiescenceMs) : kQuiescenceMs;
    }
    if (stop != ErrorKind::NONE) {
      Finish_(stop, StopMessage(stop));
      return;
    }

    long timeout = std::min(kPollSliceMs, MsUntil(now, deadline_));
    if (!awaiting) timeout = std::min(timeout, MsUntil(now, last_activity + milliseconds(window)));
    pollfd fds[4] = {
      {child->Fd(Stream::STDOUT), POLLIN, 0},
      {child->Fd(Stream::STDERR), POLLIN, 0},
      {child->HasPendingStdin() ? child->StdinFd() : -1, POLLOUT, 0},
      {wake_pipe_[0], POLLIN, 0},
    };
    if (poll(fds, 4, timeout) < 0 && errno != EINTR) {
      spdlog::warn("poll failed in session {}: {}", id_, strerror(errno));
      Finish_(ErrorKind::SANDBOX_ERROR, "");
      return;
    }
    DrainWake_();
    if (fds[2].fd >= 0 && fds[2].revents) child->FlushStdin();

    std::string out, err;
    ReadAvailable(*child, Stream::STDOUT, out);
    ReadAvailable(*child, Stream::STDERR, err);
    now = Clock::now();
    bool exceeded = false;
    if (!out.empty() || !err.empty()) {
      last_activity = now;
      std::lock_guard lck(mtx_);
      output_ += out;
      stderr_ += err;
      exceeded = output_.size() + stderr_.size() > output_limit;
      // a slow computation misread as a prompt
      if (state_ == SessionState::AWAITING_INPUT) SetState_(SessionState::RUNNING);
      if (!out.empty()) cv_.notify_all();
    }
    if (exceeded) {
      Finish_(ErrorKind::OUTPUT_LIMIT, fmt::format("Output exceeded {} KiB", kMaxOutput));
      return;
    }
    if (child->HasExited()) break;

    std::lock_guard lck(mtx_);
    if (state_ == SessionState::RUNNING) {
      bool prompt = kPromptHeuristic && !output_.empty() && output_.back() != '\n';
      window = prompt ? std::min(kPromptQuiescenceMs, kQuiescenceMs) : kQuiescenceMs;
      if (now - last_activity >= milliseconds(window)) SetState_(SessionState::AWAITING_INPUT);
    }
  }

  // the leader is gone; take down whatever it left in its group, then collect the rest
  child->KillGroup();
  std::string out, err;
  ReadAvailable(*child, Stream::STDOUT, out);
  ReadAvailable(*child, Stream::STDERR, err);
  int status = child->Reap();
  std::string detail;
  bool exceeded;
  {
    std::lock_guard lck(mtx_);
    output_ += out;
    stderr_ += err;
    exceeded = output_.size() + stderr_.size() > output_limit;
    detail = stderr_.empty() ? LastLine(output_) : stderr_;
  }
  if (exceeded) {
    Finish_(ErrorKind::OUTPUT_LIMIT, fmt::format("Output exceeded {} KiB", kMaxOutput));
  } else if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
    Finish_(ErrorKind::NONE, "", 0);
  } else {
    std::string msg = "Program " + DescribeStatus(status);
    if (!detail.empty()) msg += "\n" + detail;
    Finish_(ErrorKind::RUNTIME_ERROR, TruncateMessage(std::move(msg), kMaxMessage), ExitCode(status));
  }
}

void ExecutionSession::Finish_(ErrorKind kind, std::string&& message, int exit_code) {
  std::unique_ptr<ChildProcess> proc;
  {
    std::lock_guard lck(mtx_);
    if (finished_) return;
    proc = std::move(process_);
  }
  if (proc) {
    proc->KillGroup();
    proc->Reap();
    proc.reset();
  }
  if (sandbox_ && !sandbox_->Release()) kind = ErrorKind::SANDBOX_ERROR;
  sandbox_.reset();

  std::lock_guard lck(mtx_);
  finished_ = true;
  finished_at_ = Clock::now();
  result_.success = kind == ErrorKind::NONE;
  result_.error = kind;
  result_.output = output_;
  result_.exit_code = exit_code;
  // internal details of infrastructure faults stay in the log
  if (kind == ErrorKind::SANDBOX_ERROR || message.empty()) {
    result_.message = result_.success ? "" : ErrorKindToDesc(kind);
  } else {
    result_.message = std::move(message);
  }
  if (result_.success && expected_output_) {
    result_.matches_expected = OutputMatches(*expected_output_, output_);
  }
  SetState_(kind == ErrorKind::NONE ? SessionState::COMPLETED :
            kind == ErrorKind::CANCELLED ? SessionState::CANCELLED : SessionState::FAILED);
  spdlog::info("Session {} finished: state={} error={} exit_code={} output={} bytes",
               id_, SessionStateName(state_), ErrorKindToAbr(kind), exit_code, output_.size());
}
