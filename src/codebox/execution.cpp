#include <codebox/execution.h>

#include <signal.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codebox/security.h>
#include <codebox/utils.h>
#include "session.h"

long kTimeoutMs = 10000;
long kCompileTimeoutMs = 8000;
long kQuiescenceMs = 300;
long kPromptQuiescenceMs = 100;
long kResultRetentionMs = 60000;
long kJanitorIntervalMs = 500;
bool kPromptHeuristic = true;
long kMaxOutput = 1024; // 1M
size_t kMaxCodeLength = 65536;
size_t kMaxInputLength = 1000;
size_t kMaxInputs = 256;
size_t kMaxSessions = 32;

namespace {

using Clock = ExecutionSession::Clock;
using SessionPtr = std::shared_ptr<ExecutionSession>;

// the worker ends a session at its deadline by itself; the janitor only steps in after this
constexpr std::chrono::milliseconds kExpireGrace(500);

std::mutex registry_mtx;
std::unordered_map<std::string, SessionPtr> session_map;

std::mutex janitor_mtx;
std::condition_variable janitor_cv;
std::thread janitor_thread;
bool janitor_stop = false;

void InitEngine() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    // writing to a program that already exited must not kill the server
    signal(SIGPIPE, SIG_IGN);
  });
}

ExecutionResult Rejection(ErrorKind kind, std::string&& message) {
  ExecutionResult ret;
  ret.error = kind;
  ret.message = std::move(message);
  return ret;
}

SessionReply Rejected(ErrorKind kind, std::string&& message) {
  SessionReply reply;
  reply.state = SessionState::FAILED;
  reply.error = kind;
  reply.message = message;
  reply.result = Rejection(kind, std::move(message));
  return reply;
}

SessionReply NoSuchSession(const std::string& id) {
  SessionReply reply;
  reply.session_id = id;
  reply.error = ErrorKind::NO_SUCH_SESSION;
  reply.message = ErrorKindToDesc(ErrorKind::NO_SUCH_SESSION);
  return reply;
}

size_t CountActive() {
  size_t ret = 0;
  for (auto& i : session_map) ret += !i.second->Terminal();
  return ret;
}

// Validates, registers and starts; nullptr with kind and message set if refused
SessionPtr Launch(const ExecutionRequest& req, ErrorKind& kind, std::string& message) {
  InitEngine();
  if ((kind = ValidateRequest(req, message)) != ErrorKind::NONE) return nullptr;
  SessionPtr session;
  {
    std::lock_guard lck(registry_mtx);
    if (size_t active = CountActive(); active >= kMaxSessions) {
      spdlog::info("Refusing execution: {} sessions active", active);
      kind = ErrorKind::BUSY;
      message = fmt::format("Too many running executions (limit {}), try again later", kMaxSessions);
      return nullptr;
    }
    std::string id;
    do {
      id = GenerateSessionId();
    } while (session_map.count(id));
    session = std::make_shared<ExecutionSession>(id, req);
    session_map.emplace(id, session);
  }
  session->Start();
  return session;
}

SessionPtr Find(const std::string& id) {
  std::lock_guard lck(registry_mtx);
  auto it = session_map.find(id);
  return it == session_map.end() ? nullptr : it->second;
}

// A terminal result is handed out once, then the session is gone
void ForgetIfDelivered(const SessionReply& reply) {
  if (!reply.found || !IsTerminal(reply.state)) return;
  SessionPtr session; // released after the lock
  std::lock_guard lck(registry_mtx);
  auto it = session_map.find(reply.session_id);
  if (it == session_map.end()) return;
  session = std::move(it->second);
  session_map.erase(it);
}

void SweepSessions() {
  auto now = Clock::now();
  std::vector<SessionPtr> evicted; // joined after the lock
  std::lock_guard lck(registry_mtx);
  for (auto it = session_map.begin(); it != session_map.end();) {
    auto& session = it->second;
    if (!session->Terminal()) {
      if (now > session->Deadline() + kExpireGrace) {
        spdlog::info("Expiring session {} past its deadline", it->first);
        session->Expire();
      }
      ++it;
    } else if (session->ResultDelivered() ||
               now - session->FinishedAt() > std::chrono::milliseconds(kResultRetentionMs)) {
      spdlog::debug("Forgetting finished session {}", it->first);
      evicted.push_back(std::move(session));
      it = session_map.erase(it);
    } else {
      ++it;
    }
  }
}

void JanitorLoop() {
  std::unique_lock lck(janitor_mtx);
  while (!janitor_cv.wait_for(lck, std::chrono::milliseconds(kJanitorIntervalMs),
                              []() { return janitor_stop; })) {
    lck.unlock();
    SweepSessions();
    lck.lock();
  }
}

} // namespace

ErrorKind ValidateRequest(const ExecutionRequest& req, std::string& message) {
  if (req.code.find_first_not_of(" \t\r\n") == std::string::npos) {
    message = "Code is empty";
    return ErrorKind::INVALID_REQUEST;
  }
  if (req.code.size() > kMaxCodeLength) {
    message = fmt::format("Code is {} bytes, the limit is {}", req.code.size(), kMaxCodeLength);
    return ErrorKind::INVALID_REQUEST;
  }
  if (req.inputs.size() > kMaxInputs) {
    message = fmt::format("{} inputs given, the limit is {}", req.inputs.size(), kMaxInputs);
    return ErrorKind::INVALID_REQUEST;
  }
  if (auto violation = ScanSource(req.code, req.lang)) {
    message = "Code " + ViolationMessage(*violation);
    return ErrorKind::SECURITY_VIOLATION;
  }
  for (size_t i = 0; i < req.inputs.size(); i++) {
    if (auto violation = ScanInput(req.inputs[i])) {
      message = fmt::format("Input #{} {}", i + 1, ViolationMessage(*violation));
      return ErrorKind::SECURITY_VIOLATION;
    }
  }
  return ErrorKind::NONE;
}

ExecutionResult Execute(const ExecutionRequest& req) {
  ErrorKind kind;
  std::string message;
  SessionPtr session = Launch(req, kind, message);
  if (!session) return Rejection(kind, std::move(message));
  SessionReply reply = session->WaitTerminal();
  ForgetIfDelivered(reply);
  return reply.result;
}

SessionReply StartSession(const ExecutionRequest& req) {
  ErrorKind kind;
  std::string message;
  SessionPtr session = Launch(req, kind, message);
  if (!session) return Rejected(kind, std::move(message));
  SessionReply reply = session->Wait();
  ForgetIfDelivered(reply);
  return reply;
}

SessionReply ProvideInput(const std::string& session_id, const std::string& input) {
  SessionPtr session = Find(session_id);
  if (!session) return NoSuchSession(session_id);
  if (auto violation = ScanInput(input)) {
    // nothing is written; the program keeps waiting for a valid value
    SessionReply reply = session->Wait(0);
    if (!IsTerminal(reply.state)) {
      reply.error = ErrorKind::SECURITY_VIOLATION;
      reply.message = "Input " + ViolationMessage(*violation);
    }
    ForgetIfDelivered(reply);
    return reply;
  }
  // if the session finished meanwhile, the wait below reports how
  if (!session->PushInput(std::string(input))) {
    spdlog::debug("Input for finished session {} dropped", session_id);
  }
  SessionReply reply = session->Wait();
  ForgetIfDelivered(reply);
  return reply;
}

SessionReply PollSession(const std::string& session_id, long max_wait_ms) {
  SessionPtr session = Find(session_id);
  if (!session) return NoSuchSession(session_id);
  SessionReply reply = session->Wait(max_wait_ms, max_wait_ms >= 0);
  ForgetIfDelivered(reply);
  return reply;
}

SessionReply StopSession(const std::string& session_id) {
  SessionPtr session;
  {
    std::lock_guard lck(registry_mtx);
    auto it = session_map.find(session_id);
    if (it == session_map.end()) return NoSuchSession(session_id);
    session = std::move(it->second);
    session_map.erase(it);
  }
  spdlog::info("Stopping session {}", session_id);
  session->Stop();
  return session->Wait(0);
}

size_t ActiveSessionCount() {
  std::lock_guard lck(registry_mtx);
  return CountActive();
}

void StopAllSessions() {
  std::unordered_map<std::string, SessionPtr> sessions;
  {
    std::lock_guard lck(registry_mtx);
    sessions.swap(session_map);
  }
  for (auto& i : sessions) i.second->Stop();
  if (sessions.size()) spdlog::info("Stopped {} sessions", sessions.size());
}

void StartJanitor() {
  std::lock_guard lck(janitor_mtx);
  if (janitor_thread.joinable()) return;
  janitor_stop = false;
  janitor_thread = std::thread(JanitorLoop);
}

void StopJanitor() {
  {
    std::lock_guard lck(janitor_mtx);
    if (!janitor_thread.joinable()) return;
    janitor_stop = true;
  }
  janitor_cv.notify_all();
  janitor_thread.join();
}
