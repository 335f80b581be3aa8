#pragma once

#include <string>

namespace colonia {

// Reads an entire file. Relative paths that do not exist from the working
// directory are also tried against the source tree and its parents, so tests
// can name data files like "data/rules/classic.json" from any build dir.
// Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// Writes through a temporary sibling file and renames it into place, creating
// parent directories as needed. Throws std::runtime_error on failure.
void write_text_file(const std::string& path, const std::string& contents);

} // namespace colonia
