#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace colonia {

enum class ErrorKind : std::uint8_t {
  // A precondition of the action does not hold. Nothing was mutated.
  Validation = 0,
  // Stale or unknown identifier in a request.
  NotFound = 1,
  // Identifier refers to something the requester does not own.
  Ownership = 2,
  // Malformed or out-of-sequence message. Connection-level.
  Protocol = 3,
};

const char* error_kind_name(ErrorKind k);
bool error_kind_from_name(const std::string& s, ErrorKind& out);

struct ActionError {
  ErrorKind kind{ErrorKind::Validation};
  std::string message;
};

inline ActionError validation_error(std::string msg) { return {ErrorKind::Validation, std::move(msg)}; }
inline ActionError not_found_error(std::string msg) { return {ErrorKind::NotFound, std::move(msg)}; }
inline ActionError ownership_error(std::string msg) { return {ErrorKind::Ownership, std::move(msg)}; }
inline ActionError protocol_error(std::string msg) { return {ErrorKind::Protocol, std::move(msg)}; }

class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class OwnershipError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ProtocolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace colonia
