#ifndef INCLUDE_CODEBOX_EXECUTION_H_
#define INCLUDE_CODEBOX_EXECUTION_H_

#include <string>
#include <vector>
#include <optional>

#include "language.h"

// ms
extern long kTimeoutMs;
extern long kCompileTimeoutMs;
extern long kQuiescenceMs;
extern long kPromptQuiescenceMs;
extern long kResultRetentionMs;
extern long kJanitorIntervalMs;
extern bool kPromptHeuristic;
// KiB, stdout + stderr
extern long kMaxOutput;
extern size_t kMaxCodeLength;
extern size_t kMaxInputLength;
extern size_t kMaxInputs;
extern size_t kMaxSessions;

#define ENUM_SESSION_STATE_ \
  X(CREATED) \
  X(COMPILING) \
  X(RUNNING) \
  X(AWAITING_INPUT) \
  /* terminal states */ \
  X(COMPLETED) \
  X(FAILED) \
  X(CANCELLED)
enum class SessionState {
#define X(name) name,
  ENUM_SESSION_STATE_
#undef X
};

#define ENUM_ERROR_KIND_ \
  X(NONE, "", "", "No error") \
  /* rejected before anything runs */ \
  X(INVALID_REQUEST, "RQ", "InvalidRequest", "Invalid request") \
  X(SECURITY_VIOLATION, "SV", "SecurityViolation", "Code rejected by security policy") \
  X(UNSUPPORTED_LANGUAGE, "UL", "UnsupportedLanguage", "Unsupported language") \
  X(BUSY, "BSY", "Busy", "Too many running executions") \
  /* failures after the sandbox is set up */ \
  X(COMPILE_ERROR, "CE", "CompileError", "Compile error") \
  X(RUNTIME_ERROR, "RE", "RuntimeError", "Runtime error") \
  X(TIMEOUT, "TLE", "TimeoutError", "Time limit exceeded") \
  X(OUTPUT_LIMIT, "OLE", "OutputLimitExceeded", "Output limit exceeded") \
  X(CANCELLED, "CAN", "CancelledError", "Execution stopped") \
  X(SANDBOX_ERROR, "SE", "SandboxError", "Internal execution error") \
  /* session lookup */ \
  X(NO_SUCH_SESSION, "NS", "NoSuchSession", "No such session")
enum class ErrorKind {
#define X(name, abr, type, desc) name,
  ENUM_ERROR_KIND_
#undef X
};

struct ExecutionRequest {
  std::string code;
  Language lang;
  std::vector<std::string> inputs; // written in order, one per AWAITING_INPUT
  std::optional<std::string> expected_output;

  ExecutionRequest() : lang(Language::PYTHON) {}
};

// Either success with the full output, or exactly one classified error;
//   output then holds what the program printed before failing
struct ExecutionResult {
  bool success;
  std::string output;
  ErrorKind error;
  std::string message;
  int exit_code; // -1 if the program never exited by itself
  std::optional<bool> matches_expected;

  ExecutionResult() : success(false), error(ErrorKind::NONE), exit_code(-1) {}
  // output accumulated before a failure is partial
  bool IsPartial() const { return !success && !output.empty(); }
};

struct SessionReply {
  bool found;
  std::string session_id;
  SessionState state;
  std::string output_delta; // output produced since the last reply
  // set for terminal states, and for a rejected input on a live session
  ErrorKind error;
  std::string message;
  ExecutionResult result; // valid only if state is terminal

  SessionReply() : found(false), state(SessionState::CREATED), error(ErrorKind::NONE) {}
};

// Checks everything that can be rejected before a process exists
// Returns NONE if the request may run; message is filled otherwise
ErrorKind ValidateRequest(const ExecutionRequest&, std::string& message);

// One-shot: run to a terminal state, feeding only the request's inputs
ExecutionResult Execute(const ExecutionRequest&);

// Interactive; each call returns once the program awaits input or has finished
SessionReply StartSession(const ExecutionRequest&);
SessionReply ProvideInput(const std::string& session_id, const std::string& input);
// max_wait_ms < 0: wait like ProvideInput; otherwise return after at most max_wait_ms
//   (or earlier on new output)
SessionReply PollSession(const std::string& session_id, long max_wait_ms = -1);
SessionReply StopSession(const std::string& session_id);

size_t ActiveSessionCount();
// Cancels every live session and forgets all of them; for shutdown
void StopAllSessions();

// Evicts sessions that outlive their deadline even if no caller polls again
void StartJanitor();
void StopJanitor();

#endif  // INCLUDE_CODEBOX_EXECUTION_H_
