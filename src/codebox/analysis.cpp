#include <codebox/analysis.h>

#include <regex>
#include <sstream>

#include <spdlog/spdlog.h>
#include <codebox/utils.h>

namespace {

const std::regex& InputPattern(Language lang) {
  constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;
  static const std::regex kPython(R"(\binput[ \t]{0,16}\(|\bsys\.stdin\b|\bfileinput\b)", kFlags);
  static const std::regex kJava(
      R"(\bScanner\b|\bSystem\.in\b|\bBufferedReader\b|\bSystem\.console[ \t]{0,16}\()", kFlags);
  static const std::regex kC(
      R"(\b(scanf|getchar|fgets|gets|getline|fgetc|getc|fscanf)[ \t]{0,16}\(|\bstdin\b)", kFlags);
  static const std::regex kCpp(
      R"(\b(std::)?cin\b|\b(scanf|getchar|fgets|gets|getline|fgetc|getc|fscanf)[ \t]{0,16}\(|\bstdin\b)",
      kFlags);
  switch (lang) {
    case Language::PYTHON: return kPython;
    case Language::JAVA: return kJava;
    case Language::C: return kC;
    case Language::CPP: return kCpp;
  }
  __builtin_unreachable();
}

std::optional<Language> LanguageFromHint(const std::string& hint) {
  constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
  static const std::regex kCpp(R"(c\+\+|\bcpp\b)", kFlags);
  static const std::regex kJava(R"(\bjava\b)", kFlags);
  static const std::regex kPython(R"(\bpython\d?\b)", kFlags);
  // an uppercase C used as a language name, not the start of C# or C++ and not a variable called c
  static const std::regex kC(
      R"(\b(in|using|with|a|the)[ \t]{1,8}C\b(?![+#])|\bC(?![+#])[ \t]{1,8}(program|code|language|source|function)s?\b)",
      std::regex::ECMAScript | std::regex::optimize);
  if (std::regex_search(hint, kCpp)) return Language::CPP;
  if (std::regex_search(hint, kJava)) return Language::JAVA;
  if (std::regex_search(hint, kPython)) return Language::PYTHON;
  if (std::regex_search(hint, kC)) return Language::C;
  return std::nullopt;
}

} // namespace

bool NeedsInput(const std::string& code, Language lang) {
  return std::regex_search(code, InputPattern(lang));
}

std::optional<Language> DetectLanguage(const std::string& code, const std::string& hint) {
  if (auto lang = LanguageFromHint(hint)) {
    spdlog::debug("Language {} detected from hint", LanguageName(*lang));
    return lang;
  }
  constexpr auto kFlags = std::regex::ECMAScript | std::regex::optimize;
  static const std::regex kJava(R"(\bpublic[ \t]{1,16}(final[ \t]{1,16})?class\b|\bSystem\.out\.|\bpublic[ \t]{1,16}static[ \t]{1,16}void[ \t]{1,16}main\b)", kFlags);
  static const std::regex kCpp(
      R"(#[ \t]{0,16}include[ \t]{0,16}<(iostream|vector|string|algorithm|map|set|bits/stdc\+\+\.h)>|\bstd::|\busing[ \t]{1,16}namespace\b|\bcout\b|\bcin\b|\b(vector|map|set|pair)[ \t]{0,4}<|\bauto\b[ \t]{1,16}&?\w+[ \t]{0,4}:)",
      kFlags);
  static const std::regex kC(
      R"(#[ \t]{0,16}include\b|\b(int|void|char|float|double|long)[ \t]{1,16}\*?\w+[ \t]{0,16}\([^)\n]{0,200}\)[ \t\r\n]{0,16}\{|\bprintf[ \t]{0,16}\()",
      kFlags);
  static const std::regex kPython(
      R"((^|\n)[ \t]{0,64}(def|class)[ \t]{1,16}\w+[^\n]{0,200}:[ \t]{0,16}(\r?\n|$)|\bprint[ \t]{0,16}\(|(^|\n)[ \t]{0,64}(import|from)[ \t]{1,16}\w+|\belif\b|\bself\b)",
      kFlags);
  // order matters: C++ is a superset of the C markers, Java's main looks like a C signature
  if (std::regex_search(code, kJava)) return Language::JAVA;
  if (std::regex_search(code, kCpp)) return Language::CPP;
  if (std::regex_search(code, kC)) return Language::C;
  if (std::regex_search(code, kPython)) return Language::PYTHON;
  return std::nullopt;
}

bool OutputMatches(const std::string& expected, const std::string& actual) {
  constexpr char kWhites[] = " \n\r\t";
  std::istringstream f_ans(expected), f_usr(actual);
  while (f_ans.eof() == f_usr.eof()) {
    if (f_ans.eof()) return true;
    std::string s, t;
    getline(f_ans, s);
    getline(f_usr, t);
    // std::string::npos + 1 == 0
    s.erase(s.find_last_not_of(kWhites) + 1);
    t.erase(t.find_last_not_of(kWhites) + 1);
    if (s != t) return false;
  }
  // whichever is longer may only continue with blank lines
  std::istringstream& rest = f_ans.eof() ? f_usr : f_ans;
  for (std::string s; getline(rest, s);) {
    if (s.find_last_not_of(kWhites) != std::string::npos) return false;
  }
  return true;
}
