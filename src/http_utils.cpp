#include "http_utils.h"

#include <cerrno>
#include <cstdlib>
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}

std::string FormatParam() {
  return "(none)";
}

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  // bodies carry user code; only the route and outcome are logged at info
  spdlog::info("{} {} from {} -> {}", req.method, req.path, req.remote_addr, res.status);
  spdlog::debug("{} {} params {} body {} bytes", req.method, req.path,
                FormatOneParam(req.params), req.body.size());
}

bool GetLongParam(const httplib::Request& req, const char* key, std::optional<long>& val) {
  if (!req.has_param(key)) return true;
  std::string str = req.get_param_value(key);
  char* end = nullptr;
  errno = 0;
  long ret = strtol(str.c_str(), &end, 10);
  if (str.empty() || *end || errno == ERANGE) return false;
  val = ret;
  return true;
}

} // namespace http_utils
