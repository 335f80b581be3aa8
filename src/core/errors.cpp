#include "colonia/core/errors.h"

namespace colonia {

const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Ownership: return "ownership";
    case ErrorKind::Protocol: return "protocol";
  }
  return "validation";
}

bool error_kind_from_name(const std::string& s, ErrorKind& out) {
  if (s == "validation") out = ErrorKind::Validation;
  else if (s == "not_found") out = ErrorKind::NotFound;
  else if (s == "ownership") out = ErrorKind::Ownership;
  else if (s == "protocol") out = ErrorKind::Protocol;
  else return false;
  return true;
}

} // namespace colonia
