#include <codebox/language.h>

#include <algorithm>
#include <cctype>

namespace {

// Quantifiers are bounded on purpose: libstdc++ std::regex recurses once per
//   character consumed by a single match attempt.
#define PY_MODULES "os|sys|subprocess|shutil|socket|ctypes|pathlib|importlib|multiprocessing|signal|pty|resource"

std::vector<DenyRule> PythonDenylist() {
  return {
    {"python-import", R"(\bimport[ \t]{1,16}[^\n;#]{0,200}\b()" PY_MODULES R"()\b)"},
    {"python-from-import", R"(\bfrom[ \t]{1,16}()" PY_MODULES R"()\b)"},
    // a bare call, not a method such as re.compile( or img.open(
    {"python-builtin", R"((^|[^.\w])(eval|exec|compile|open|__import__|globals|locals|vars|getattr|setattr|delattr|breakpoint)[ \t]{0,16}\()"},
    {"python-dunder", R"(__(builtins|subclasses|globals|code|loader|spec)__)"},
  };
}

#undef PY_MODULES

std::vector<DenyRule> JavaDenylist() {
  return {
    {"java-runtime", R"(\bRuntime\b)"},
    {"java-process", R"(\bProcess(Builder|Handle)?\b)"},
    {"java-reflection",
     R"(\bjava\.lang\.reflect\b|\bClass\.forName\b|\.getDeclared(Method|Field|Constructor)s?\b|\.setAccessible\b|\.getMethod\b)"},
    {"java-file-io",
     R"(\bjava\.nio\.file\b|\b(File|FileReader|FileWriter|FileInputStream|FileOutputStream|RandomAccessFile|Files|Paths)\b)"},
    {"java-network", R"(\bjava\.net\b|\b(Socket|ServerSocket|URLConnection|HttpClient)\b)"},
    {"java-system", R"(\bSystem\.(exit|load|loadLibrary|setSecurityManager)\b)"},
  };
}

std::vector<DenyRule> CDenylist(bool cpp) {
  std::string headers = "stdlib\\.h|unistd\\.h|sys/[^>\"\\n]{1,64}|fcntl\\.h|signal\\.h|dlfcn\\.h|spawn\\.h|pthread\\.h";
  std::string calls = "system|popen|fork|vfork|execl|execlp|execle|execv|execvp|execvpe|execve|"
                      "syscall|kill|fopen|freopen|creat|unlink|dlopen|mmap|ptrace";
  if (cpp) {
    // bits/stdc++.h would pull in every header listed here
    headers += "|cstdlib|csignal|fstream|filesystem|thread|bits/stdc\\+\\+\\.h";
  } else {
    // std::remove/rename are common C++ algorithms; in C they only touch files
    calls += "|open|remove|rename";
  }
  return {
    {cpp ? "cpp-header" : "c-header", "#[ \\t]{0,16}include[ \\t]{0,16}[<\"](" + headers + ")[>\"]"},
    // free functions only; obj.open( and p->kill( are members, std::system( is not
    {cpp ? "cpp-call" : "c-call", "(^|[^.\\w>]|[^-]>)(" + calls + ")[ \\t]{0,16}\\("},
    {cpp ? "cpp-asm" : "c-asm", "\\b(asm|__asm|__asm__)\\b"},
  };
}

std::vector<LanguageProfile> BuildProfiles() {
  std::vector<LanguageProfile> ret;
  // keep in ENUM_LANGUAGE_ order; ResolveProfile indexes by enum value
  ret.push_back({
    Language::PYTHON, "main.py", "",
    {},
    {"/usr/bin/env", "python3", "-u", "main.py"},
    PythonDenylist(),
  });
  ret.push_back({
    Language::JAVA, "Main.java", "Main.class",
    {"/usr/bin/env", "javac", "-nowarn", "-XDsuppressNotes", "-encoding", "UTF-8", "Main.java"},
    {"/usr/bin/env", "java", "-cp", ".", "Main"},
    JavaDenylist(),
  });
  // stdbuf: stdout of a C program on a pipe is fully buffered, which would hold back prompts
  ret.push_back({
    Language::C, "main.c", "main",
    {"/usr/bin/env", "gcc", "-std=c11", "-O2", "-w", "-o", "main", "main.c", "-lm"},
    {"/usr/bin/env", "stdbuf", "-o0", "./main"},
    CDenylist(false),
  });
  ret.push_back({
    Language::CPP, "main.cpp", "main",
    {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w", "-o", "main", "main.cpp"},
    {"/usr/bin/env", "stdbuf", "-o0", "./main"},
    CDenylist(true),
  });
  return ret;
}

} // namespace

const LanguageProfile& ResolveProfile(Language lang) {
  static const std::vector<LanguageProfile> kProfiles = BuildProfiles();
  return kProfiles[(int)lang];
}

bool GetLanguage(const std::string& key, Language& lang) {
  static const std::pair<const char*, Language> kAliases[] = {
#define X(name, key) {key, Language::name},
    ENUM_LANGUAGE_
#undef X
    {"python3", Language::PYTHON},
    {"py", Language::PYTHON},
    {"c++", Language::CPP},
    {"cxx", Language::CPP},
  };
  std::string str;
  for (char c : key) {
    if (!isspace((unsigned char)c)) str.push_back(tolower((unsigned char)c));
  }
  auto it = std::find_if(std::begin(kAliases), std::end(kAliases),
                         [&str](const auto& i) { return str == i.first; });
  if (it == std::end(kAliases)) return false;
  lang = it->second;
  return true;
}
