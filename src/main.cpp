#include <signal.h>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <codebox/logger.h>
#include <codebox/paths.h>
#include <codebox/execution.h>
#include "server_io.h"

namespace {

constexpr char kDefaultConfig[] = "/etc/codebox.conf";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  kTimeoutMs = ini[""]["timeout_ms"] | kTimeoutMs;
  kCompileTimeoutMs = ini[""]["compile_timeout_ms"] | kCompileTimeoutMs;
  kQuiescenceMs = ini[""]["quiescence_ms"] | kQuiescenceMs;
  kPromptQuiescenceMs = ini[""]["prompt_quiescence_ms"] | kPromptQuiescenceMs;
  kPromptHeuristic = ini[""]["prompt_heuristic"] | kPromptHeuristic;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kMaxCodeLength = ini[""]["max_code_length"] | kMaxCodeLength;
  kMaxInputLength = ini[""]["max_input_length"] | kMaxInputLength;
  kMaxInputs = ini[""]["max_inputs"] | kMaxInputs;
  kMaxSessions = ini[""]["max_sessions"] | kMaxSessions;
  kResultRetentionMs = ini[""]["result_retention_ms"] | kResultRetentionMs;
  kJanitorIntervalMs = ini[""]["janitor_interval_ms"] | kJanitorIntervalMs;
  kListenHost = ini[""]["host"] | kListenHost;
  kListenPort = ini[""]["port"] | kListenPort;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codebox-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default " + std::string(kDefaultConfig) + ")");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("-t", "--timeout-ms")
    .scan<'d', long>()
    .help("Wall-clock limit of one execution in milliseconds");
  parser.add_argument("-q", "--quiescence-ms")
    .scan<'d', long>()
    .help("Silence after which a running program is taken to wait for input");
  parser.add_argument("--box-root")
    .help("Directory under which sandboxes are created");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  // an explicitly named file must exist; the default one is optional
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(1);
    }
  } else if (!ParseConfig(kDefaultConfig)) {
    spdlog::warn("Configuration file {} not found, using defaults", kDefaultConfig);
  }
  if (auto val = parser.present<int>("--port")) kListenPort = val.value();
  if (auto val = parser.present("--host")) kListenHost = val.value();
  if (auto val = parser.present<long>("--timeout-ms")) kTimeoutMs = val.value();
  if (auto val = parser.present<long>("--quiescence-ms")) kQuiescenceMs = val.value();
  if (auto val = parser.present("--box-root")) kBoxRoot = val.value();
  if (kTimeoutMs <= 0 || kQuiescenceMs <= 0 || kPromptQuiescenceMs <= 0 || kMaxSessions == 0) {
    spdlog::error("Timeouts and max_sessions must be positive");
    exit(1);
  }
}

// Blocks SIGINT/SIGTERM in every thread and turns them into a server stop
void HandleStopSignals() {
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &mask, nullptr);
  std::thread([mask]() {
    int sig = 0;
    sigwait(&mask, &sig);
    spdlog::info("Received signal {}, shutting down", sig);
    StopServer();
  }).detach();
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  ParseArgs(argc, argv);
  spdlog::info("Sandboxes under {}, timeout {} ms, at most {} sessions",
               kBoxRoot.string(), kTimeoutMs, kMaxSessions);
  HandleStopSignals();
  StartJanitor();
  bool ok = ServerWorkLoop();
  StopAllSessions();
  StopJanitor();
  return ok ? 0 : 1;
}
