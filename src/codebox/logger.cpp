#include <codebox/logger.h>

#include <spdlog/spdlog.h>

// Forked children never log: between fork() and execve() they only make
//   async-signal-safe calls (see process.cpp), so sink mutexes need no atfork handling.
void InitLogger(int verbosity) {
  spdlog::set_pattern("[%t] %+");
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  spdlog::debug("Logger initialized, verbosity={}", verbosity);
}
