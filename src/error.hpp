#ifndef FORKLIFT_ERROR_HPP
#define FORKLIFT_ERROR_HPP

#include <string>

auto PrintAssertionMessage(char const *file, int line,
                           char const *function_name,
                           char const *message = nullptr) -> void;
auto PrintBackTrace() -> void;

#define FORKLIFT_ASSERT(expr, ...)                                             \
  do {                                                                         \
    if ((!(expr))) [[unlikely]] {                                              \
      PrintAssertionMessage(__FILE__, __LINE__,                                \
                            __func__ __VA_OPT__(, ) __VA_ARGS__);              \
      PrintBackTrace();                                                        \
      __builtin_trap();                                                        \
    }                                                                          \
  } while (0)

enum class ForkliftErrorType {
  Unknown,
  ConfigError,
  ForkError,
  WaitError,
  ResultFileError,
  CodecError,
  DriverError
};

struct ForkliftError {
  ForkliftErrorType error_type = ForkliftErrorType::Unknown;
  std::string error_message;
};

auto ToString(ForkliftErrorType error_type) -> char const *;

#endif
