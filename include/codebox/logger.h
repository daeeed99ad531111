#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// verbosity: 0 = warn, 1 = info, 2+ = debug
void InitLogger(int verbosity = 0);

#endif  // INCLUDE_CODEBOX_LOGGER_H_
