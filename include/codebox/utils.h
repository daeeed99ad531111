#ifndef INCLUDE_CODEBOX_UTILS_H_
#define INCLUDE_CODEBOX_UTILS_H_

#include <string>

#include "language.h"
#include "execution.h"

std::string GenerateSessionId();

const char* LanguageName(Language);

const char* ErrorKindToAbr(ErrorKind);
const char* ErrorKindToType(ErrorKind);
const char* ErrorKindToDesc(ErrorKind);

const char* SessionStateName(SessionState);
bool IsTerminal(SessionState);

#endif  // INCLUDE_CODEBOX_UTILS_H_
