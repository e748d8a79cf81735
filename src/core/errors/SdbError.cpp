#include "SdbError.hpp"

namespace lsdb {

const char* errorCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameterValue: return "InvalidParameterValue";
    case ErrorKind::MissingParameter:      return "MissingParameter";
    case ErrorKind::NumberDomainsExceeded: return "NumberDomainsExceeded";
    case ErrorKind::InternalError:         return "InternalError";
  }
  return "InternalError";
}

SdbError SdbError::invalidParameter(const std::string& param, const std::string& value) {
  return SdbError(ErrorKind::InvalidParameterValue,
                  "Value (" + value + ") for parameter " + param + " is invalid.");
}

SdbError SdbError::missingParameter(const std::string& param) {
  return SdbError(ErrorKind::MissingParameter,
                  "The request must contain the parameter " + param + ".");
}

SdbError SdbError::domainsExceeded() {
  return SdbError(ErrorKind::NumberDomainsExceeded, "Number of domains limit exceeded.");
}

SdbError SdbError::internal(const std::string& message) {
  return SdbError(ErrorKind::InternalError, message);
}

} // namespace lsdb
