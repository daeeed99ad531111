#ifndef INCLUDE_CODEBOX_SECURITY_H_
#define INCLUDE_CODEBOX_SECURITY_H_

#include <string>
#include <optional>

#include "language.h"

struct Violation {
  std::string rule;
  std::string matched_text;
};

// Denylist scan of the submitted source; also rejects empty or oversized code
std::optional<Violation> ScanSource(const std::string& code, Language lang);

// One input value (one line of stdin): length and control characters
std::optional<Violation> ScanInput(const std::string& input);

std::string ViolationMessage(const Violation&);

#endif  // INCLUDE_CODEBOX_SECURITY_H_
