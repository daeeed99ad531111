#ifndef CODEBOX_UTILS_H_
#define CODEBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <codebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm600 = fs::perms::owner_read | fs::perms::owner_write;

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

bool SetNonBlocking(int fd);

// Keep at most max_len bytes and note the truncation
std::string TruncateMessage(std::string&& msg, size_t max_len);

#endif  // CODEBOX_UTILS_H_
