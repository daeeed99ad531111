#include "server_io.h"

#include <algorithm>
#include <mutex>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "http_utils.h"
#include <codebox/analysis.h>
#include <codebox/utils.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8740;

namespace {

using nlohmann::json;
using httplib::Request;
using httplib::Response;

// one per session that may be blocked in a long wait, plus a few for quick endpoints
constexpr size_t kExtraServerThreads = 8;

std::mutex server_mtx;
httplib::Server* running_server = nullptr;

void Respond(Response& res, int status, const json& body) {
  res.status = status;
  // program output need not be valid UTF-8
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

json ErrorJson(ErrorKind kind, const std::string& message, bool partial) {
  return json{
    {"type", ErrorKindToType(kind)},
    {"code", ErrorKindToAbr(kind)},
    {"message", message},
    {"partial", partial},
  };
}

void RespondError(Response& res, ErrorKind kind, const std::string& message) {
  Respond(res, HttpStatus(kind), json{{"error", ErrorJson(kind, message, false)}});
}

ErrorKind ParseJsonBody(const std::string& body, json& data, std::string& message) {
  try {
    data = json::parse(body);
    if (!data.is_object()) {
      message = "Malformed request: body must be a JSON object";
      return ErrorKind::INVALID_REQUEST;
    }
  } catch (json::exception& err) {
    spdlog::info("Request parsing error: {}", err.what());
    message = fmt::format("Malformed request: {}", err.what());
    return ErrorKind::INVALID_REQUEST;
  }
  return ErrorKind::NONE;
}

ErrorKind ParseLanguage(const json& data, Language& lang, std::string& message) {
  std::string key = data.at("language").get<std::string>();
  if (!GetLanguage(key, lang)) {
    message = fmt::format("Unsupported language '{}'", key.substr(0, 32));
    return ErrorKind::UNSUPPORTED_LANGUAGE;
  }
  return ErrorKind::NONE;
}

void HandleExecute(const Request& req, Response& res) {
  ExecutionRequest exec;
  ExecutionResult result;
  if (ErrorKind err = ParseExecutionRequest(req.body, exec, result.message); err != ErrorKind::NONE) {
    result.error = err;
  } else {
    result = Execute(exec);
  }
  Respond(res, HttpStatus(result.error), ResultToJson(result));
}

void HandleStartSession(const Request& req, Response& res) {
  ExecutionRequest exec;
  std::string message;
  if (ErrorKind err = ParseExecutionRequest(req.body, exec, message); err != ErrorKind::NONE) {
    return RespondError(res, err, message);
  }
  SessionReply reply = StartSession(exec);
  Respond(res, HttpStatus(reply.error), ReplyToJson(reply));
}

void HandleInput(const Request& req, Response& res) {
  json data;
  std::string message, input;
  if (ErrorKind err = ParseJsonBody(req.body, data, message); err != ErrorKind::NONE) {
    return RespondError(res, err, message);
  }
  try {
    input = data.at("input").get<std::string>();
  } catch (json::exception& err) {
    return RespondError(res, ErrorKind::INVALID_REQUEST, fmt::format("Malformed request: {}", err.what()));
  }
  SessionReply reply = ProvideInput(req.matches[1], input);
  Respond(res, HttpStatus(reply.error), ReplyToJson(reply));
}

void HandlePoll(const Request& req, Response& res) {
  std::optional<long> wait_ms;
  if (!http_utils::GetLongParam(req, "wait_ms", wait_ms) || (wait_ms && *wait_ms < 0)) {
    return RespondError(res, ErrorKind::INVALID_REQUEST, "wait_ms must be a non-negative integer");
  }
  SessionReply reply = PollSession(req.matches[1], wait_ms ? std::min(*wait_ms, kTimeoutMs) : -1);
  Respond(res, HttpStatus(reply.error), ReplyToJson(reply));
}

void HandleStop(const Request& req, Response& res) {
  SessionReply reply = StopSession(req.matches[1]);
  Respond(res, HttpStatus(reply.error), ReplyToJson(reply));
}

void HandleCheckInput(const Request& req, Response& res) {
  json data;
  std::string message;
  Language lang = Language::PYTHON;
  try {
    ErrorKind err = ParseJsonBody(req.body, data, message);
    if (err == ErrorKind::NONE) err = ParseLanguage(data, lang, message);
    if (err != ErrorKind::NONE) return RespondError(res, err, message);
    Respond(res, 200, json{{"needs_input", NeedsInput(data.at("code").get<std::string>(), lang)}});
  } catch (json::exception& err) {
    RespondError(res, ErrorKind::INVALID_REQUEST, fmt::format("Malformed request: {}", err.what()));
  }
}

void HandleDetectLanguage(const Request& req, Response& res) {
  json data;
  std::string message;
  if (ErrorKind err = ParseJsonBody(req.body, data, message); err != ErrorKind::NONE) {
    return RespondError(res, err, message);
  }
  try {
    auto lang = DetectLanguage(data.at("code").get<std::string>(), data.value("hint", std::string()));
    Respond(res, 200, json{{"language", lang ? json(LanguageName(*lang)) : json(nullptr)}});
  } catch (json::exception& err) {
    RespondError(res, ErrorKind::INVALID_REQUEST, fmt::format("Malformed request: {}", err.what()));
  }
}

} // namespace

ErrorKind ParseExecutionRequest(const std::string& body, ExecutionRequest& req, std::string& message) {
  json data;
  if (ErrorKind err = ParseJsonBody(body, data, message); err != ErrorKind::NONE) return err;
  try {
    req.code = data.at("code").get<std::string>();
    if (ErrorKind err = ParseLanguage(data, req.lang, message); err != ErrorKind::NONE) return err;
    if (auto it = data.find("inputs"); it != data.end() && !it->is_null()) {
      req.inputs = it->get<std::vector<std::string>>();
    }
    if (auto it = data.find("expected_output"); it != data.end() && !it->is_null()) {
      req.expected_output = it->get<std::string>();
    }
  } catch (json::exception& err) {
    spdlog::info("Request parsing error: {}", err.what());
    message = fmt::format("Malformed request: {}", err.what());
    return ErrorKind::INVALID_REQUEST;
  }
  return ErrorKind::NONE;
}

json RequestToJson(const ExecutionRequest& req) {
  json ret{{"code", req.code}, {"language", LanguageName(req.lang)}, {"inputs", req.inputs}};
  if (req.expected_output) ret["expected_output"] = *req.expected_output;
  return ret;
}

json ResultToJson(const ExecutionResult& result) {
  json ret{
    {"success", result.success},
    {"output", result.output},
    {"error", result.success ? json(nullptr) : ErrorJson(result.error, result.message, result.IsPartial())},
    {"exit_code", result.exit_code < 0 ? json(nullptr) : json(result.exit_code)},
  };
  if (result.matches_expected) ret["matches_expected"] = *result.matches_expected;
  return ret;
}

json ReplyToJson(const SessionReply& reply) {
  json ret{{"session_id", reply.session_id}};
  if (!reply.found) {
    ret["error"] = reply.error == ErrorKind::NONE ? json(nullptr) : ErrorJson(reply.error, reply.message, false);
    if (reply.error != ErrorKind::NO_SUCH_SESSION) ret["result"] = ResultToJson(reply.result);
    return ret;
  }
  bool terminal = IsTerminal(reply.state);
  ret["state"] = SessionStateName(reply.state);
  ret["output"] = reply.output_delta;
  ret["awaiting_input"] = reply.state == SessionState::AWAITING_INPUT;
  ret["finished"] = terminal;
  ret["error"] = reply.error == ErrorKind::NONE ? json(nullptr) :
      ErrorJson(reply.error, reply.message, terminal && reply.result.IsPartial());
  if (terminal) ret["result"] = ResultToJson(reply.result);
  return ret;
}

int HttpStatus(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::INVALID_REQUEST: return 400;
    case ErrorKind::NO_SUCH_SESSION: return 404;
    case ErrorKind::BUSY: return 503;
    default: return 200;
  }
}

void RegisterRoutes(httplib::Server& svr) {
  svr.Post("/execute", HandleExecute);
  svr.Post("/sessions", HandleStartSession);
  svr.Post(R"(/sessions/([^/]+)/input)", HandleInput);
  svr.Post(R"(/sessions/([^/]+)/stop)", HandleStop);
  svr.Get(R"(/sessions/([^/]+))", HandlePoll);
  svr.Post("/check-input-needed", HandleCheckInput);
  svr.Post("/detect-language", HandleDetectLanguage);
  svr.Get("/health", [](const Request&, Response& res) {
    Respond(res, 200, json{{"status", "ok"}, {"sessions", ActiveSessionCount()}});
  });
}

bool ServerWorkLoop() {
  httplib::Server svr;
  RegisterRoutes(svr);
  svr.set_logger(http_utils::LogRequest);
  // interactive calls block until the program waits for input, so size the pool by sessions
  svr.new_task_queue = []() { return new httplib::ThreadPool(kMaxSessions + kExtraServerThreads); };
  {
    std::lock_guard lck(server_mtx);
    running_server = &svr;
  }
  spdlog::info("Listening on {}:{}", kListenHost, kListenPort);
  bool ok = svr.listen(kListenHost.c_str(), kListenPort);
  {
    std::lock_guard lck(server_mtx);
    running_server = nullptr;
  }
  if (!ok) spdlog::error("Failed to listen on {}:{}", kListenHost, kListenPort);
  return ok;
}

void StopServer() {
  std::lock_guard lck(server_mtx);
  if (running_server) running_server->stop();
}
