#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <gtest/gtest.h>
#include <codebox/execution.h>
#include <codebox/utils.h>

bool HasProgram(const std::string& name);
bool HasToolchain(Language lang);

#define SKIP_WITHOUT_TOOLCHAIN(lang) \
  if (!HasToolchain(lang)) GTEST_SKIP() << LanguageName(lang) << " toolchain not installed"

ExecutionRequest MakeRequest(Language lang, const std::string& code, std::vector<std::string> inputs = {});

// Live (non-zombie) processes whose working directory is inside kBoxRoot
size_t ProcessesUnderBoxRoot();
// Live (non-zombie) processes in the given process group
size_t ProcessesInGroup(pid_t pgid);
// Entries directly under kBoxRoot
size_t SandboxCount();

bool WaitFor(const std::function<bool()>& cond, std::chrono::milliseconds limit);

// Puts the engine limits back after a test changes them
class ConfigGuard {
  long timeout_ms_, compile_timeout_ms_, quiescence_ms_, retention_ms_, max_output_;
  size_t max_sessions_;
 public:
  ConfigGuard() :
      timeout_ms_(kTimeoutMs), compile_timeout_ms_(kCompileTimeoutMs), quiescence_ms_(kQuiescenceMs),
      retention_ms_(kResultRetentionMs), max_output_(kMaxOutput),
      max_sessions_(kMaxSessions) {}
  ~ConfigGuard() {
    kTimeoutMs = timeout_ms_;
    kCompileTimeoutMs = compile_timeout_ms_;
    kQuiescenceMs = quiescence_ms_;
    kResultRetentionMs = retention_ms_;
    kMaxOutput = max_output_;
    kMaxSessions = max_sessions_;
  }
};

#endif // TEST_UTILS_H_
