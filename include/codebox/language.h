#ifndef INCLUDE_CODEBOX_LANGUAGE_H_
#define INCLUDE_CODEBOX_LANGUAGE_H_

#include <string>
#include <vector>

#define ENUM_LANGUAGE_ \
  X(PYTHON, "python") \
  X(JAVA, "java") \
  X(C, "c") \
  X(CPP, "cpp")
enum class Language {
#define X(name, key) name,
  ENUM_LANGUAGE_
#undef X
};

// Matching is textual (ECMAScript regex on the raw source, case-sensitive).
// It is a deterrent, not a proof of safety: comments and string literals match too,
//   and an indirect enough program still gets through.
struct DenyRule {
  std::string name;
  std::string pattern;
};

// Data only; the session state machine is the same for every language.
struct LanguageProfile {
  Language lang;
  std::string source_name;
  std::string artifact_name; // empty if interpreted
  std::vector<std::string> compile_command; // empty if no compile step
  std::vector<std::string> run_command;
  std::vector<DenyRule> denylist;

  bool HasCompileStep() const { return !compile_command.empty(); }
};

// Immutable; built on first use
const LanguageProfile& ResolveProfile(Language);

// false if the key names no supported language (UnsupportedLanguage)
bool GetLanguage(const std::string& key, Language& lang);

#endif  // INCLUDE_CODEBOX_LANGUAGE_H_
