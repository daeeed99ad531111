#include "utils.h"

#include <fcntl.h>
#include <cstring>
#include <atomic>
#include <fstream>
#include <random>
#include <mutex>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long session_seq = 0;
std::mutex rng_mtx;

} // namespace

std::string GenerateSessionId() {
  uint64_t a, b;
  {
    // every bit comes from the device; std::random_device is not required to be thread safe
    std::lock_guard lck(rng_mtx);
    std::random_device rd;
    a = (uint64_t)rd() << 32 | rd();
    b = (uint64_t)rd() << 32 | rd();
  }
  // the sequence part keeps ids unique even if the device repeats
  b ^= (uint64_t)++session_seq;
  return fmt::format("{:016x}{:016x}", a, b);
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindToAbr, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG3(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindToType, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG4(ErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorKindToDesc, ErrorKind, ENUM_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(SessionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionStateName, SessionState, ENUM_SESSION_STATE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

bool IsTerminal(SessionState state) {
  return (int)state >= (int)SessionState::COMPLETED;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, {} bytes", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
      spdlog::warn("Failed writing {}", path.c_str());
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    spdlog::warn("Failed setting O_NONBLOCK on fd {}: {}", fd, strerror(errno));
    return false;
  }
  return true;
}

std::string TruncateMessage(std::string&& msg, size_t max_len) {
  if (msg.size() <= max_len) return std::move(msg);
  msg.resize(max_len);
  msg += "\n[Message truncated after " + std::to_string(max_len) + " bytes]";
  return std::move(msg);
}
