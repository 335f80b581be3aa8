#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace colonia {

std::string to_lower(std::string s);

std::string trim_copy(const std::string& s);

// Concatenates streamable parts into a string. Used for log and error text.
template <typename... Parts>
std::string concat(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

} // namespace colonia
