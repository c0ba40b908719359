#ifndef NETFILE_ERROR_HPP
#define NETFILE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace netfile {

enum class ErrorKind {
  EOF_REACHED,
  UNEXPECTED_EOF,
  SHORT_BUFFER,
  SHORT_WRITE,
  CLOSED_PIPE,
  NO_PROGRESS,
  UNAUTHORIZED,
  NOT_FOUND,
  UNSUPPORTED_OPERATION,
  ALREADY_REGISTERED,
  MALFORMED_REQUEST,
  BODY_LENGTH_MISMATCH,
  PROTOCOL_VIOLATION,
  INVALID_OFFSET,
  IO_ERROR,
  CANCELLED,
  DEADLINE_EXCEEDED,
  CONFIG_ERROR,
  UNKNOWN
};

inline const char* error_kind_to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::EOF_REACHED: return "EOF";
    case ErrorKind::UNEXPECTED_EOF: return "unexpected EOF";
    case ErrorKind::SHORT_BUFFER: return "short buffer";
    case ErrorKind::SHORT_WRITE: return "short write";
    case ErrorKind::CLOSED_PIPE: return "read/write on closed pipe";
    case ErrorKind::NO_PROGRESS: return "multiple Read calls return no data or error";
    case ErrorKind::UNAUTHORIZED: return "unauthorized: wrong secret key";
    case ErrorKind::NOT_FOUND: return "not found: unknown file";
    case ErrorKind::UNSUPPORTED_OPERATION: return "unsupported operation";
    case ErrorKind::ALREADY_REGISTERED: return "fileID is already being used";
    case ErrorKind::MALFORMED_REQUEST: return "malformed request";
    case ErrorKind::BODY_LENGTH_MISMATCH: return "invalid body length";
    case ErrorKind::PROTOCOL_VIOLATION: return "protocol violation";
    case ErrorKind::INVALID_OFFSET: return "invalid offset";
    case ErrorKind::IO_ERROR: return "I/O error";
    case ErrorKind::CANCELLED: return "context canceled";
    case ErrorKind::DEADLINE_EXCEEDED: return "context deadline exceeded";
    case ErrorKind::CONFIG_ERROR: return "configuration error";
    case ErrorKind::UNKNOWN: return "unknown error";
    default: return "undefined error";
  }
}

// Every failure surfaced by netfile, locally or from a remote peer
class Error : public std::runtime_error {
public:
  explicit Error(ErrorKind kind)
    : std::runtime_error(error_kind_to_string(kind))
    , kind_(kind) {}

  Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace netfile

#endif // NETFILE_ERROR_HPP
