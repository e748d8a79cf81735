#pragma once
#include <stdexcept>
#include <string>

namespace lsdb {

enum class ErrorKind {
  InvalidParameterValue,
  MissingParameter,
  NumberDomainsExceeded,
  InternalError
};

// Stable wire code for a fault kind ("InvalidParameterValue", ...).
const char* errorCode(ErrorKind kind);

// Every fault raised by the emulator. what() is the human-readable message.
class SdbError : public std::runtime_error {
public:
  SdbError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }
  const char* code() const { return errorCode(kind_); }

  static SdbError invalidParameter(const std::string& param, const std::string& value);
  static SdbError missingParameter(const std::string& param);
  static SdbError domainsExceeded();
  static SdbError internal(const std::string& message);

private:
  ErrorKind kind_;
};

} // namespace lsdb
