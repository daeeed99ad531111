#include <thread>
#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "server_io.h"
#include "utils.h"

using nlohmann::json;

namespace {

using namespace std::chrono_literals;

class ServerTest : public ::testing::Test {
 protected:
  httplib::Server svr;
  std::thread thread;
  std::unique_ptr<httplib::Client> cli;

  void SetUp() override {
    RegisterRoutes(svr);
    int port = svr.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    thread = std::thread([this]() { svr.listen_after_bind(); });
    ASSERT_TRUE(WaitFor([this]() { return svr.is_running(); }, 5000ms));
    cli = std::make_unique<httplib::Client>("127.0.0.1", port);
    cli->set_read_timeout(30, 0);
  }
  void TearDown() override {
    svr.stop();
    if (thread.joinable()) thread.join();
  }

  // status and parsed body
  std::pair<int, json> Post(const std::string& path, const std::string& body) {
    auto res = cli->Post(path.c_str(), body, "application/json");
    if (!res) return {-1, json()};
    return {res->status, json::parse(res->body)};
  }
  std::pair<int, json> Get(const std::string& path) {
    auto res = cli->Get(path.c_str());
    if (!res) return {-1, json()};
    return {res->status, json::parse(res->body)};
  }
};

} // namespace

TEST(ServerIO, ParseRequest) {
  ExecutionRequest req;
  std::string message;
  ASSERT_EQ(ParseExecutionRequest(
      R"({"code": "print(input())", "language": "Python3", "inputs": ["1", "two"], "expected_output": "1\n"})",
      req, message), ErrorKind::NONE) << message;
  EXPECT_EQ(req.code, "print(input())");
  EXPECT_EQ(req.lang, Language::PYTHON);
  EXPECT_EQ(req.inputs, (std::vector<std::string>{"1", "two"}));
  ASSERT_TRUE(req.expected_output);
  EXPECT_EQ(*req.expected_output, "1\n");

  req = ExecutionRequest();
  ASSERT_EQ(ParseExecutionRequest(R"({"code": "int main() {}", "language": "cpp", "inputs": null})",
                                  req, message), ErrorKind::NONE);
  EXPECT_EQ(req.lang, Language::CPP);
  EXPECT_TRUE(req.inputs.empty());
  EXPECT_FALSE(req.expected_output);
}

TEST(ServerIO, ParseRequestErrors) {
  ExecutionRequest req;
  std::string message;
  EXPECT_EQ(ParseExecutionRequest("not json", req, message), ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(message.rfind("Malformed request", 0), 0u) << message;
  EXPECT_EQ(ParseExecutionRequest("[1, 2]", req, message), ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(ParseExecutionRequest(R"({"language": "python"})", req, message), ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(ParseExecutionRequest(R"({"code": "x"})", req, message), ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(ParseExecutionRequest(R"({"code": 5, "language": "python"})", req, message),
            ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(ParseExecutionRequest(R"({"code": "x", "language": "python", "inputs": "1"})", req, message),
            ErrorKind::INVALID_REQUEST);
  EXPECT_EQ(ParseExecutionRequest(R"({"code": "x", "language": "python", "inputs": [1]})", req, message),
            ErrorKind::INVALID_REQUEST);

  EXPECT_EQ(ParseExecutionRequest(R"({"code": "puts 1", "language": "ruby"})", req, message),
            ErrorKind::UNSUPPORTED_LANGUAGE);
  EXPECT_NE(message.find("ruby"), std::string::npos) << message;
  ParseExecutionRequest(R"({"code": "x", "language": ")" + std::string(500, 'z') + R"("})", req, message);
  EXPECT_LT(message.size(), 100u);
}

TEST(ServerIO, RequestJson) {
  auto req = MakeRequest(Language::JAVA, "class Main {}", {"3"});
  req.expected_output = "9";
  json data = RequestToJson(req);
  EXPECT_EQ(data["language"], "java");
  EXPECT_EQ(data["inputs"], json({"3"}));
  EXPECT_EQ(data["expected_output"], "9");

  ExecutionRequest parsed;
  std::string message;
  ASSERT_EQ(ParseExecutionRequest(data.dump(), parsed, message), ErrorKind::NONE);
  EXPECT_EQ(parsed.code, req.code);
  EXPECT_EQ(parsed.lang, req.lang);
}

TEST(ServerIO, ResultJson) {
  ExecutionResult result;
  result.success = true;
  result.output = "hi\n";
  result.exit_code = 0;
  EXPECT_EQ(ResultToJson(result),
            json::parse(R"({"success": true, "output": "hi\n", "error": null, "exit_code": 0})"));

  result.matches_expected = false;
  EXPECT_EQ(ResultToJson(result)["matches_expected"], false);

  ExecutionResult failed;
  failed.output = "before\n";
  failed.error = ErrorKind::RUNTIME_ERROR;
  failed.message = "Program exited with status 1";
  failed.exit_code = 1;
  json data = ResultToJson(failed);
  EXPECT_EQ(data["success"], false);
  EXPECT_EQ(data["output"], "before\n");
  EXPECT_EQ(data["exit_code"], 1);
  EXPECT_EQ(data["error"], json::parse(
      R"({"type": "RuntimeError", "code": "RE", "message": "Program exited with status 1", "partial": true})"));
  EXPECT_FALSE(data.contains("matches_expected"));

  ExecutionResult rejected;
  rejected.error = ErrorKind::SECURITY_VIOLATION;
  rejected.message = "Code rejected";
  data = ResultToJson(rejected);
  EXPECT_TRUE(data["exit_code"].is_null());
  EXPECT_EQ(data["error"]["type"], "SecurityViolation");
  EXPECT_EQ(data["error"]["partial"], false);
}

TEST(ServerIO, ReplyJson) {
  SessionReply awaiting;
  awaiting.found = true;
  awaiting.session_id = "abc";
  awaiting.state = SessionState::AWAITING_INPUT;
  awaiting.output_delta = "Name: ";
  json data = ReplyToJson(awaiting);
  EXPECT_EQ(data["session_id"], "abc");
  EXPECT_EQ(data["state"], "AWAITING_INPUT");
  EXPECT_EQ(data["output"], "Name: ");
  EXPECT_EQ(data["awaiting_input"], true);
  EXPECT_EQ(data["finished"], false);
  EXPECT_TRUE(data["error"].is_null());
  EXPECT_FALSE(data.contains("result"));

  SessionReply done = awaiting;
  done.state = SessionState::CANCELLED;
  done.error = done.result.error = ErrorKind::CANCELLED;
  done.message = done.result.message = "Execution stopped by request";
  done.result.output = "Name: ";
  data = ReplyToJson(done);
  EXPECT_EQ(data["finished"], true);
  EXPECT_EQ(data["awaiting_input"], false);
  EXPECT_EQ(data["error"]["type"], "CancelledError");
  EXPECT_EQ(data["error"]["partial"], true);
  EXPECT_EQ(data["result"]["output"], "Name: ");

  SessionReply missing;
  missing.session_id = "gone";
  missing.error = ErrorKind::NO_SUCH_SESSION;
  missing.message = "No such session";
  data = ReplyToJson(missing);
  EXPECT_EQ(data["error"]["code"], "NS");
  EXPECT_FALSE(data.contains("state"));
  EXPECT_FALSE(data.contains("result"));

  SessionReply busy;
  busy.state = SessionState::FAILED;
  busy.error = busy.result.error = ErrorKind::BUSY;
  data = ReplyToJson(busy);
  EXPECT_EQ(data["error"]["type"], "Busy");
  EXPECT_EQ(data["result"]["error"]["code"], "BSY");
}

TEST(ServerIO, Status) {
  EXPECT_EQ(HttpStatus(ErrorKind::NONE), 200);
  EXPECT_EQ(HttpStatus(ErrorKind::INVALID_REQUEST), 400);
  EXPECT_EQ(HttpStatus(ErrorKind::NO_SUCH_SESSION), 404);
  EXPECT_EQ(HttpStatus(ErrorKind::BUSY), 503);
  // execution outcomes are successful calls
  EXPECT_EQ(HttpStatus(ErrorKind::SECURITY_VIOLATION), 200);
  EXPECT_EQ(HttpStatus(ErrorKind::UNSUPPORTED_LANGUAGE), 200);
  EXPECT_EQ(HttpStatus(ErrorKind::TIMEOUT), 200);
}

TEST_F(ServerTest, Health) {
  auto [status, body] = Get("/health");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["sessions"], 0);
}

TEST_F(ServerTest, Analysis) {
  auto [status, body] = Post("/detect-language", R"({"code": "#include <iostream>\nint main() { std::cout << 1; }"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["language"], "cpp");
  std::tie(status, body) = Post("/detect-language", R"({"code": "x = 1", "hint": "Write it in Java"})");
  EXPECT_EQ(body["language"], "java");
  std::tie(status, body) = Post("/detect-language", R"({"code": "x = 1"})");
  EXPECT_EQ(status, 200);
  EXPECT_TRUE(body["language"].is_null());
  std::tie(status, body) = Post("/detect-language", R"({"hint": "c"})");
  EXPECT_EQ(status, 400);

  std::tie(status, body) = Post("/check-input-needed", R"({"code": "n = int(input())", "language": "python"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["needs_input"], true);
  std::tie(status, body) = Post("/check-input-needed", R"({"code": "print(1)", "language": "python"})");
  EXPECT_EQ(body["needs_input"], false);
  std::tie(status, body) = Post("/check-input-needed", R"({"code": "print(1)", "language": "ruby"})");
  EXPECT_EQ(body["error"]["type"], "UnsupportedLanguage");
}

TEST_F(ServerTest, BadRequests) {
  auto [status, body] = Post("/execute", "{not json");
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["error"]["type"], "InvalidRequest");

  std::tie(status, body) = Post("/execute", R"({"language": "python"})");
  EXPECT_EQ(status, 400);
  std::tie(status, body) = Post("/sessions", R"({"code": "print(1)"})");
  EXPECT_EQ(status, 400);
  EXPECT_EQ(body["error"]["code"], "RQ");

  std::tie(status, body) = Post("/execute", R"({"code": "puts 1", "language": "ruby"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["error"]["type"], "UnsupportedLanguage");

  std::tie(status, body) = Post("/execute", R"({"code": "import os\nos.system('ls')", "language": "python"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], false);
  EXPECT_EQ(body["output"], "");
  EXPECT_EQ(body["error"]["type"], "SecurityViolation");
  EXPECT_EQ(body["error"]["partial"], false);
}

TEST_F(ServerTest, UnknownSession) {
  auto [status, body] = Get("/sessions/deadbeef");
  EXPECT_EQ(status, 404);
  EXPECT_EQ(body["session_id"], "deadbeef");
  EXPECT_EQ(body["error"]["type"], "NoSuchSession");
  std::tie(status, body) = Post("/sessions/deadbeef/input", R"({"input": "1"})");
  EXPECT_EQ(status, 404);
  std::tie(status, body) = Post("/sessions/deadbeef/stop", "");
  EXPECT_EQ(status, 404);
  std::tie(status, body) = Post("/sessions/deadbeef/input", R"({"text": "1"})");
  EXPECT_EQ(status, 400);
  std::tie(status, body) = Get("/sessions/deadbeef?wait_ms=-5");
  EXPECT_EQ(status, 400);
  std::tie(status, body) = Get("/sessions/deadbeef?wait_ms=soon");
  EXPECT_EQ(status, 400);
}

TEST_F(ServerTest, Execute) {
  SKIP_WITHOUT_TOOLCHAIN(Language::PYTHON);
  auto [status, body] = Post("/execute",
      R"({"code": "print(int(input()) * 2)", "language": "python", "inputs": ["21"], "expected_output": "42"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["success"], true) << body.dump();
  EXPECT_EQ(body["output"], "42\n");
  EXPECT_TRUE(body["error"].is_null());
  EXPECT_EQ(body["exit_code"], 0);
  EXPECT_EQ(body["matches_expected"], true);
}

TEST_F(ServerTest, Session) {
  SKIP_WITHOUT_TOOLCHAIN(Language::PYTHON);
  auto [status, body] = Post("/sessions",
      R"({"code": "name = input('Name: ')\nprint('Hello, ' + name)", "language": "python"})");
  ASSERT_EQ(status, 200);
  std::string id = body["session_id"].get<std::string>();
  std::string out = body["output"].get<std::string>();
  auto end = std::chrono::steady_clock::now() + 8000ms;
  while (!(body["awaiting_input"] == true && out == "Name: ") && body["finished"] == false &&
         std::chrono::steady_clock::now() < end) {
    std::tie(status, body) = Get("/sessions/" + id + "?wait_ms=100");
    ASSERT_EQ(status, 200);
    out += body["output"].get<std::string>();
  }
  ASSERT_EQ(body["state"], "AWAITING_INPUT");
  EXPECT_EQ(out, "Name: ");

  std::tie(status, body) = Post("/sessions/" + id + "/input", R"({"input": "Ada"})");
  EXPECT_EQ(status, 200);
  EXPECT_EQ(body["state"], "COMPLETED");
  EXPECT_EQ(body["finished"], true);
  EXPECT_EQ(body["output"], "Hello, Ada\n");
  EXPECT_EQ(body["result"]["output"], "Name: Hello, Ada\n");

  std::tie(status, body) = Get("/sessions/" + id);
  EXPECT_EQ(status, 404);
}
