#ifndef INCLUDE_BENCHBOX_LOGGER_H_
#define INCLUDE_BENCHBOX_LOGGER_H_

// Route the default logger to stderr; stdout is reserved for results.
// verbosity: 0 = warn, 1 = info, 2+ = debug
void InitLogger(int verbosity);

#endif  // INCLUDE_BENCHBOX_LOGGER_H_
