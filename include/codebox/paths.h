#ifndef INCLUDE_CODEBOX_PATHS_H_
#define INCLUDE_CODEBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every sandbox is a fresh directory directly under it
extern fs::path kBoxRoot;

#endif  // INCLUDE_CODEBOX_PATHS_H_
