#include "error/status_codes.hpp"
#include <boost/log/trivial.hpp>

namespace netfile {

//==============================================
// SERVER SIDE
//==============================================

std::optional<unsigned> status_for_error(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::UNAUTHORIZED: return 401;
    case ErrorKind::NOT_FOUND: return 404;
    case ErrorKind::EOF_REACHED: return HTTP_CODE_EOF;
    case ErrorKind::UNEXPECTED_EOF: return HTTP_CODE_UNEXPECTED_EOF;
    case ErrorKind::SHORT_BUFFER: return HTTP_CODE_SHORT_BUFFER;
    case ErrorKind::SHORT_WRITE: return HTTP_CODE_SHORT_WRITE;
    case ErrorKind::CLOSED_PIPE: return HTTP_CODE_CLOSED_PIPE;
    case ErrorKind::NO_PROGRESS: return HTTP_CODE_NO_PROGRESS;
    case ErrorKind::UNSUPPORTED_OPERATION: return HTTP_CODE_UNSUPPORTED_OPERATION;
    case ErrorKind::MALFORMED_REQUEST: return 400;
    case ErrorKind::BODY_LENGTH_MISMATCH: return 400;
    default: return std::nullopt;
  }
}

unsigned status_for_exception(const std::exception& error, std::string& body) {
  if (const auto* netfile_error = dynamic_cast<const Error*>(&error)) {
    if (auto status = status_for_error(netfile_error->kind())) {
      // 400 answers carry a short reason, mapped kinds speak for themselves
      if (*status == 400) {
        body = netfile_error->what();
      }
      return *status;
    }
  }

  body = error.what();
  return HTTP_CODE_UNKNOWN_ERROR;
}


//==============================================
// CLIENT SIDE
//==============================================

std::optional<ErrorKind> error_for_status(unsigned status) {
  switch (status) {
    case 400: return ErrorKind::MALFORMED_REQUEST;
    case 401: return ErrorKind::UNAUTHORIZED;
    case 403: return ErrorKind::UNSUPPORTED_OPERATION;
    case 404: return ErrorKind::NOT_FOUND;
    case HTTP_CODE_EOF: return ErrorKind::EOF_REACHED;
    case HTTP_CODE_UNEXPECTED_EOF: return ErrorKind::UNEXPECTED_EOF;
    case HTTP_CODE_SHORT_BUFFER: return ErrorKind::SHORT_BUFFER;
    case HTTP_CODE_SHORT_WRITE: return ErrorKind::SHORT_WRITE;
    case HTTP_CODE_CLOSED_PIPE: return ErrorKind::CLOSED_PIPE;
    case HTTP_CODE_NO_PROGRESS: return ErrorKind::NO_PROGRESS;
    case HTTP_CODE_UNSUPPORTED_OPERATION: return ErrorKind::UNSUPPORTED_OPERATION;
    default: return std::nullopt;
  }
}

Error error_from_response(unsigned status, const std::string& body) {
  auto kind = error_for_status(status);
  if (kind) {
    if (*kind == ErrorKind::MALFORMED_REQUEST && !body.empty()) {
      return Error(*kind, std::string(error_kind_to_string(*kind)) + ": " + body);
    }
    return Error(*kind);
  }

  std::string text = body.substr(0, MAX_ERROR_BODY);
  BOOST_LOG_TRIVIAL(debug) << "Status codes: Unmapped status " << status << " with body: " << text;
  return Error(ErrorKind::UNKNOWN,
               std::to_string(status) + ": an unknown error occurred: " + text);
}

} // namespace netfile
