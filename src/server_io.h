#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <codebox/execution.h>

extern std::string kListenHost;
extern int kListenPort;

// JSON mapping of the engine API. Parse errors never throw: they come back as
//   INVALID_REQUEST (malformed or mistyped) or UNSUPPORTED_LANGUAGE with a message.
ErrorKind ParseExecutionRequest(const std::string& body, ExecutionRequest& req, std::string& message);
nlohmann::json RequestToJson(const ExecutionRequest&);
nlohmann::json ResultToJson(const ExecutionResult&);
nlohmann::json ReplyToJson(const SessionReply&);
int HttpStatus(ErrorKind);

void RegisterRoutes(httplib::Server&);

// Serves on kListenHost:kListenPort until StopServer() is called.
// Returns false if it could not listen.
bool ServerWorkLoop();
void StopServer();

#endif  // SERVER_IO_H_
