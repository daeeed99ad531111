#ifndef CODEBOX_SANDBOX_H_
#define CODEBOX_SANDBOX_H_

#include <chrono>
#include <memory>
#include <string>
#include <filesystem>

// One fresh directory per execution, removed when released or destroyed.
// Never reused, so nothing a previous run left behind (e.g. a compiled binary) is visible.
class Sandbox {
  std::filesystem::path path_;
  std::chrono::steady_clock::time_point created_;
  std::string owner_;
  bool released_;

  Sandbox(std::filesystem::path&& path, const std::string& owner);
 public:
  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  ~Sandbox();

  // nullptr on failure (already logged)
  static std::unique_ptr<Sandbox> Acquire(const std::string& owner);

  const std::filesystem::path& Path() const { return path_; }
  const std::string& Owner() const { return owner_; }
  bool Released() const { return released_; }

  // name must be a plain file name inside the sandbox
  bool WriteFile(const std::string& name, const std::string& content);
  bool Exists(const std::string& name) const;

  // Deletes the directory; only the first call does anything
  bool Release();
};

#endif  // CODEBOX_SANDBOX_H_
