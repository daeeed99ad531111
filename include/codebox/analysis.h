#ifndef INCLUDE_CODEBOX_ANALYSIS_H_
#define INCLUDE_CODEBOX_ANALYSIS_H_

#include <string>
#include <optional>

#include "language.h"

// Whether the program appears to read stdin; textual, like the denylist
bool NeedsInput(const std::string& code, Language lang);

// hint: free text around the submission (e.g. the question), may name the language
std::optional<Language> DetectLanguage(const std::string& code, const std::string& hint = "");

// Line by line, ignoring trailing whitespace on each line and trailing empty lines
bool OutputMatches(const std::string& expected, const std::string& actual);

#endif  // INCLUDE_CODEBOX_ANALYSIS_H_
