#include "utils.h"

#include <unistd.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <filesystem>

#include <codebox/paths.h>

namespace {

// fields of /proc/<pid>/stat after the parenthesized command name
bool ReadStat(const fs::path& dir, char& state, pid_t& pgrp) {
  std::ifstream fin(dir / "stat");
  std::string content;
  if (!std::getline(fin, content)) return false;
  size_t pos = content.rfind(')');
  if (pos == std::string::npos) return false;
  std::istringstream ss(content.substr(pos + 1));
  pid_t ppid;
  return (bool)(ss >> state >> ppid >> pgrp);
}

template <class Func> size_t CountProcesses(Func&& pred) {
  size_t ret = 0;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator("/proc", ec)) {
    std::string name = entry.path().filename();
    if (name.find_first_not_of("0123456789") != std::string::npos) continue;
    char state;
    pid_t pgrp;
    if (!ReadStat(entry.path(), state, pgrp) || state == 'Z') continue;
    if (pred(entry.path(), pgrp)) ret++;
  }
  return ret;
}

} // namespace

bool HasProgram(const std::string& name) {
  const char* path = getenv("PATH");
  std::istringstream ss(path ? path : "/usr/bin:/bin");
  for (std::string dir; std::getline(ss, dir, ':');) {
    if (!dir.empty() && access((fs::path(dir) / name).c_str(), X_OK) == 0) return true;
  }
  return false;
}

bool HasToolchain(Language lang) {
  switch (lang) {
    case Language::PYTHON: return HasProgram("python3");
    case Language::JAVA: return HasProgram("javac") && HasProgram("java");
    case Language::C: return HasProgram("gcc") && HasProgram("stdbuf");
    case Language::CPP: return HasProgram("g++") && HasProgram("stdbuf");
  }
  return false;
}

ExecutionRequest MakeRequest(Language lang, const std::string& code, std::vector<std::string> inputs) {
  ExecutionRequest req;
  req.lang = lang;
  req.code = code;
  req.inputs = std::move(inputs);
  return req;
}

size_t ProcessesUnderBoxRoot() {
  std::string root = fs::weakly_canonical(kBoxRoot).string() + "/";
  return CountProcesses([&](const fs::path& dir, pid_t) {
    std::error_code ec;
    std::string cwd = fs::read_symlink(dir / "cwd", ec).string() + "/";
    return !ec && cwd.compare(0, root.size(), root) == 0;
  });
}

size_t ProcessesInGroup(pid_t pgid) {
  return CountProcesses([&](const fs::path&, pid_t pgrp) { return pgrp == pgid; });
}

size_t SandboxCount() {
  std::error_code ec;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(kBoxRoot, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ret++;
  return ret;
}

bool WaitFor(const std::function<bool()>& cond, std::chrono::milliseconds limit) {
  auto end = std::chrono::steady_clock::now() + limit;
  while (!cond()) {
    if (std::chrono::steady_clock::now() >= end) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return true;
}
