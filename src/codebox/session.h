#ifndef CODEBOX_SESSION_H_
#define CODEBOX_SESSION_H_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <codebox/execution.h>
#include "process.h"
#include "sandbox.h"

// One execution: a worker thread drives
//   CREATED -> [COMPILING] -> RUNNING <-> AWAITING_INPUT -> COMPLETED | FAILED | CANCELLED
// Everything below the mutex is shared with callers; the sandbox and the
//   compiler process belong to the worker alone.
class ExecutionSession {
 public:
  using Clock = std::chrono::steady_clock;

  ExecutionSession(const std::string& id, const ExecutionRequest& req);
  ExecutionSession(const ExecutionSession&) = delete;
  ExecutionSession& operator=(const ExecutionSession&) = delete;
  // joins the worker; the session must be terminal or about to be
  ~ExecutionSession();

  const std::string& Id() const { return id_; }
  Clock::time_point Deadline() const { return deadline_; }

  void Start();

  // Queues one line for the program; false if the session already finished
  bool PushInput(std::string&& input);
  // Cancels and waits for the teardown
  void Stop();
  // Ends a session that overran its deadline with TIMEOUT
  void Expire();

  // Returns when the queued inputs are consumed and the program awaits input,
  //   or on a terminal state, or after max_wait_ms (< 0: bounded by the deadline only).
  // return_on_output: also return as soon as there is undelivered output.
  SessionReply Wait(long max_wait_ms = -1, bool return_on_output = false);
  // Returns only on a terminal state
  SessionReply WaitTerminal();

  bool Terminal();
  // a terminal result was handed to some caller
  bool ResultDelivered();
  Clock::time_point FinishedAt();

 private:
  const std::string id_;
  const Language lang_;
  const Clock::time_point deadline_;
  std::string code_;
  std::optional<std::string> expected_output_;

  std::mutex mtx_;
  std::condition_variable cv_;
  SessionState state_;
  std::deque<std::string> inputs_;
  std::string output_, stderr_;
  size_t delivered_; // prefix of output_ already returned as a delta
  bool stop_requested_, expire_requested_;
  bool finished_, result_delivered_;
  ExecutionResult result_;
  Clock::time_point finished_at_;
  std::unique_ptr<ChildProcess> process_; // non-null only while RUNNING / AWAITING_INPUT

  std::unique_ptr<Sandbox> sandbox_;
  std::thread worker_;
  int wake_pipe_[2];

  void Wake_();
  void DrainWake_();
  void SetState_(SessionState);
  SessionReply Snapshot_(); // mtx_ held
  // Returns the error that should end the session now, or NONE; mtx_ held
  ErrorKind PendingStop_(Clock::time_point now) const;

  void Run_();
  bool Compile_();
  void RunProgram_();
  void Finish_(ErrorKind, std::string&& message, int exit_code = -1);
};

#endif  // CODEBOX_SESSION_H_
