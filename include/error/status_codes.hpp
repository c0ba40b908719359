#ifndef NETFILE_STATUS_CODES_HPP
#define NETFILE_STATUS_CODES_HPP

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include "error/netfile_error.hpp"

namespace netfile {

// Protocol specific status codes layered on top of the standard HTTP ones
constexpr unsigned HTTP_CODE_EOF = 480;
constexpr unsigned HTTP_CODE_UNEXPECTED_EOF = 481;
constexpr unsigned HTTP_CODE_SHORT_BUFFER = 482;
constexpr unsigned HTTP_CODE_SHORT_WRITE = 483;
constexpr unsigned HTTP_CODE_CLOSED_PIPE = 484;
constexpr unsigned HTTP_CODE_NO_PROGRESS = 486;
constexpr unsigned HTTP_CODE_UNKNOWN_ERROR = 490;
constexpr unsigned HTTP_CODE_UNSUPPORTED_OPERATION = 491;

// Longest remote error text carried into a client side error message
constexpr std::size_t MAX_ERROR_BODY = 512;


// ---- SERVER SIDE ----
// Returns the status that carries the given error kind, nullopt when it has none
std::optional<unsigned> status_for_error(ErrorKind kind);
// Returns the status and body the server answers with for a failure
unsigned status_for_exception(const std::exception& error, std::string& body);


// ---- CLIENT SIDE ----
// Returns the error kind carried by a status, nullopt for unmapped statuses
std::optional<ErrorKind> error_for_status(unsigned status);
// Converts a non-expected response into the error the caller sees
Error error_from_response(unsigned status, const std::string& body);

} // namespace netfile

#endif // NETFILE_STATUS_CODES_HPP
