#include "sandbox.h"

#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>
#include <codebox/paths.h>
#include "utils.h"

Sandbox::Sandbox(fs::path&& path, const std::string& owner) :
    path_(std::move(path)),
    created_(std::chrono::steady_clock::now()),
    owner_(owner),
    released_(false) {}

Sandbox::~Sandbox() {
  Release();
}

std::unique_ptr<Sandbox> Sandbox::Acquire(const std::string& owner) {
  if (!CreateDirs(kBoxRoot)) return nullptr;
  std::string tmpl = (kBoxRoot / "box.XXXXXX").string();
  // mkdtemp creates the directory with mode 0700
  if (!mkdtemp(tmpl.data())) {
    spdlog::warn("Failed creating sandbox under {}: {}", kBoxRoot.c_str(), strerror(errno));
    return nullptr;
  }
  spdlog::debug("Sandbox {} acquired by session {}", tmpl, owner);
  return std::unique_ptr<Sandbox>(new Sandbox(fs::path(tmpl), owner));
}

bool Sandbox::WriteFile(const std::string& name, const std::string& content) {
  if (released_) return false;
  if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
    spdlog::warn("Refusing to write {} into sandbox {}", name, path_.c_str());
    return false;
  }
  return ::WriteFile(path_ / name, content, kPerm600);
}

bool Sandbox::Exists(const std::string& name) const {
  std::error_code ec;
  return !released_ && fs::exists(path_ / name, ec);
}

bool Sandbox::Release() {
  if (released_) return true;
  released_ = true;
  auto age = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - created_);
  spdlog::debug("Sandbox {} of session {} released after {} ms", path_.c_str(), owner_, age.count());
  return RemoveAll(path_);
}
