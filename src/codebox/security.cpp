#include <codebox/security.h>

#include <regex>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <codebox/utils.h>
#include <codebox/execution.h>

namespace {

constexpr size_t kMaxMatchedText = 80;

struct CompiledRule {
  const DenyRule* rule;
  std::regex regex;
};

std::vector<std::vector<CompiledRule>> CompileAll() {
  std::vector<std::vector<CompiledRule>> ret;
#define X(name, key) { \
    auto& rules = ret.emplace_back(); \
    for (auto& i : ResolveProfile(Language::name).denylist) { \
      rules.push_back({&i, std::regex(i.pattern, std::regex::ECMAScript | std::regex::optimize)}); \
    } \
  }
  ENUM_LANGUAGE_
#undef X
  return ret;
}

const std::vector<CompiledRule>& Rules(Language lang) {
  static const std::vector<std::vector<CompiledRule>> kRules = CompileAll();
  return kRules[(int)lang];
}

} // namespace

std::optional<Violation> ScanSource(const std::string& code, Language lang) {
  if (code.find_first_not_of(" \t\r\n") == std::string::npos) {
    return Violation{"code-empty", ""};
  }
  if (code.size() > kMaxCodeLength) {
    return Violation{"code-length", std::to_string(code.size()) + " bytes"};
  }
  for (auto& i : Rules(lang)) {
    std::smatch match;
    if (std::regex_search(code, match, i.regex)) {
      // call rules also match the character before the name
      std::string text = match.str(0);
      size_t start = text.find_first_not_of(" \t\r\n");
      text = start == std::string::npos ? "" : text.substr(start, kMaxMatchedText);
      spdlog::info("Source rejected: lang={} rule={} match=\"{}\"", LanguageName(lang), i.rule->name, text);
      return Violation{i.rule->name, std::move(text)};
    }
  }
  return std::nullopt;
}

std::optional<Violation> ScanInput(const std::string& input) {
  if (input.size() > kMaxInputLength) {
    return Violation{"input-length", std::to_string(input.size()) + " characters"};
  }
  for (size_t i = 0; i < input.size(); i++) {
    unsigned char c = input[i];
    if ((c < 0x20 && c != '\t') || c == 0x7f) {
      return Violation{"input-control-char", fmt::format("\\x{:02x} at offset {}", c, i)};
    }
  }
  return std::nullopt;
}

std::string ViolationMessage(const Violation& violation) {
  std::string ret = "rejected before running by rule '" + violation.rule + "'";
  if (!violation.matched_text.empty()) ret += " (matched \"" + violation.matched_text + "\")";
  return ret;
}
