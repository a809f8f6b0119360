#include "tabrescue/error.h"

#include <sstream>

namespace tabrescue {

const char* error_code_to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::NONE:
    return "NONE";
  case ErrorCode::UNCLOSED_QUOTE:
    return "UNCLOSED_QUOTE";
  case ErrorCode::INCONSISTENT_FIELD_COUNT:
    return "INCONSISTENT_FIELD_COUNT";
  case ErrorCode::FIELD_TOO_LARGE:
    return "FIELD_TOO_LARGE";
  default:
    return "UNKNOWN";
  }
}

const char* error_severity_to_string(ErrorSeverity severity) {
  switch (severity) {
  case ErrorSeverity::WARNING:
    return "WARNING";
  case ErrorSeverity::RECOVERABLE:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

const char* strategy_to_string(StrategyKind kind) {
  switch (kind) {
  case StrategyKind::STRICT_QUOTE:
    return "strict-quote";
  case StrategyKind::ESCAPED_QUOTE:
    return "escaped-quote";
  case StrategyKind::QUOTE_BLIND:
    return "quote-blind";
  case StrategyKind::QUOTE_REPAIRED:
    return "quote-repaired";
  default:
    return "unknown";
  }
}

std::string ParseError::to_string() const {
  std::ostringstream ss;
  ss << "[" << error_severity_to_string(severity) << "] " << error_code_to_string(code)
     << " at line " << line << ", column " << column << " (byte " << byte_offset
     << "): " << message;
  return ss.str();
}

std::string ParseAttempt::to_string() const {
  std::ostringstream ss;
  ss << strategy_to_string(strategy) << ": ";
  if (success) {
    ss << "ok";
  } else {
    ss << error_code_to_string(error.code) << " at line " << error.line << ", column "
       << error.column << ": " << error.message;
  }
  return ss.str();
}

} // namespace tabrescue
