#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codebox/analysis.h>
#include <codebox/execution.h>
#include <codebox/logger.h>
#include <codebox/paths.h>
#include <codebox/utils.h>
#include "http_utils.h"
#include "server_io.h"

namespace {

using nlohmann::json;

std::unique_ptr<httplib::Client> remote;

ErrorKind ErrorFromCode(const std::string& code) {
#define X(name, abr, type, desc) if (code == abr) return ErrorKind::name;
  ENUM_ERROR_KIND_
#undef X
  return ErrorKind::SANDBOX_ERROR;
}

SessionState StateFromName(const std::string& name) {
#define X(name_) if (name == #name_) return SessionState::name_;
  ENUM_SESSION_STATE_
#undef X
  return SessionState::FAILED;
}

void ErrorFromJson(const json& data, ErrorKind& error, std::string& message) {
  if (!data.is_object()) return;
  error = ErrorFromCode(data.at("code").get<std::string>());
  message = data.at("message").get<std::string>();
}

ExecutionResult ResultFromJson(const json& data) {
  ExecutionResult ret;
  ret.success = data.at("success").get<bool>();
  ret.output = data.at("output").get<std::string>();
  ErrorFromJson(data.at("error"), ret.error, ret.message);
  if (auto& code = data.at("exit_code"); !code.is_null()) ret.exit_code = code.get<int>();
  if (auto it = data.find("matches_expected"); it != data.end()) ret.matches_expected = it->get<bool>();
  return ret;
}

SessionReply ReplyFromJson(const json& data) {
  SessionReply ret;
  ret.session_id = data.value("session_id", std::string());
  if (auto it = data.find("error"); it != data.end()) ErrorFromJson(*it, ret.error, ret.message);
  if (auto it = data.find("result"); it != data.end()) ret.result = ResultFromJson(*it);
  if (auto it = data.find("state"); it != data.end()) {
    ret.found = true;
    ret.state = StateFromName(it->get<std::string>());
    ret.output_delta = data.at("output").get<std::string>();
  } else {
    ret.state = SessionState::FAILED;
  }
  return ret;
}

// Fatal on transport errors: there is nothing sensible to retry for a running program
json RemoteCall(const std::string& endpoint, const json& body) {
  auto res = HTTPRequest<HTTPPost>(*remote, endpoint, body.dump(), "application/json");
  if (!res) {
    std::cerr << "Request to " << endpoint << " failed: " << httplib::to_string(res.error()) << std::endl;
    exit(1);
  }
  try {
    return json::parse(res->body);
  } catch (json::exception& err) {
    std::cerr << "Bad response from " << endpoint << " (HTTP " << res->status << "): " << err.what() << std::endl;
    exit(1);
  }
}

ExecutionResult DoExecute(const ExecutionRequest& req) {
  if (!remote) return Execute(req);
  json body = RequestToJson(req);
  return ResultFromJson(RemoteCall("/execute", body));
}

SessionReply DoStart(const ExecutionRequest& req) {
  if (!remote) return StartSession(req);
  json body = RequestToJson(req);
  return ReplyFromJson(RemoteCall("/sessions", body));
}

SessionReply DoInput(const std::string& id, const std::string& input) {
  if (!remote) return ProvideInput(id, input);
  json body{{"input", input}};
  return ReplyFromJson(RemoteCall("/sessions/" + id + "/input", body));
}

SessionReply DoStop(const std::string& id) {
  if (!remote) return StopSession(id);
  return ReplyFromJson(RemoteCall("/sessions/" + id + "/stop", json::object()));
}

int ReportResult(const ExecutionResult& result, bool print_output) {
  if (print_output) std::cout << result.output << std::flush;
  if (result.matches_expected) {
    std::cerr << (*result.matches_expected ? "Output matches expected" : "Output differs from expected") << std::endl;
  }
  if (result.success) return result.matches_expected.value_or(true) ? 0 : 1;
  std::cerr << "[" << ErrorKindToType(result.error) << "] " << result.message << std::endl;
  if (result.IsPartial()) std::cerr << "(output above is partial)" << std::endl;
  return result.exit_code > 0 ? result.exit_code : 1;
}

int RunInteractive(const ExecutionRequest& req) {
  SessionReply reply = DoStart(req);
  while (true) {
    std::cout << reply.output_delta << std::flush;
    if (!reply.found || IsTerminal(reply.state)) return ReportResult(reply.result, false);
    if (reply.error != ErrorKind::NONE) std::cerr << "[" << ErrorKindToType(reply.error) << "] " << reply.message << std::endl;
    std::string line;
    if (!std::getline(std::cin, line)) {
      reply = DoStop(reply.session_id);
      std::cout << reply.output_delta << std::flush;
      return ReportResult(reply.result, false);
    }
    reply = DoInput(reply.session_id, line);
  }
}

std::string ReadFile(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    std::cerr << "Cannot open " << path << std::endl;
    exit(1);
  }
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

} // namespace

int main(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser("codebox-run");
  parser.add_argument("file")
    .help("Source file to run");
  parser.add_argument("-l", "--language")
    .help("python, java, c or cpp (default: from the file extension or the code)");
  parser.add_argument("-i", "--input")
    .append()
    .help("One line of standard input; repeat for more");
  parser.add_argument("-e", "--expected")
    .help("File with the expected output");
  parser.add_argument("-I", "--interactive")
    .default_value(false).implicit_value(true)
    .help("Read inputs from the terminal whenever the program waits for one");
  parser.add_argument("-s", "--server")
    .help("Run on a codebox-server (e.g. http://127.0.0.1:8740) instead of locally");
  parser.add_argument("-t", "--timeout-ms")
    .scan<'d', long>()
    .help("Wall-clock limit in milliseconds (local runs only)");
  parser.add_argument("--box-root")
    .help("Directory under which sandboxes are created (local runs only)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  InitLogger(verbosity);

  std::string file = parser.get<std::string>("file");
  ExecutionRequest req;
  req.code = ReadFile(file);
  if (auto lang = parser.present("--language")) {
    if (!GetLanguage(*lang, req.lang)) {
      std::cerr << "Unsupported language " << *lang << std::endl;
      return 1;
    }
  } else if (std::string ext = fs::path(file).extension().string();
             ext.size() < 2 || !GetLanguage(ext.substr(1), req.lang)) {
    auto detected = DetectLanguage(req.code);
    if (!detected) {
      std::cerr << "Cannot tell the language of " << file << "; use --language" << std::endl;
      return 1;
    }
    req.lang = *detected;
  }
  spdlog::info("Running {} as {}", file, LanguageName(req.lang));
  if (auto inputs = parser.present<std::vector<std::string>>("--input")) req.inputs = *inputs;
  if (auto expected = parser.present("--expected")) req.expected_output = ReadFile(*expected);
  if (auto val = parser.present<long>("--timeout-ms")) kTimeoutMs = val.value();
  if (auto val = parser.present("--box-root")) kBoxRoot = val.value();
  if (auto url = parser.present("--server")) {
    remote = std::make_unique<httplib::Client>(*url);
    // a call returns only once the program waits for input or ends
    remote->set_read_timeout(kTimeoutMs / 1000 + 5, 0);
  }

  int ret;
  if (parser.get<bool>("--interactive")) {
    if (!remote && !NeedsInput(req.code, req.lang)) spdlog::info("The program does not seem to read input");
    ret = RunInteractive(req);
  } else {
    ret = ReportResult(DoExecute(req), true);
  }
  if (!remote) StopAllSessions();
  return ret;
}
