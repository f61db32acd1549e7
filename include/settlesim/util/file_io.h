#pragma once

#include <string>
#include <vector>

namespace settlesim {

// Reads entire file into a string. Throws std::runtime_error on failure.
//
// Relative paths that do not exist from the working directory are also looked up
// under SETTLESIM_SOURCE_DIR (when defined) and the working directory's parents, so
// tests and the CLI find data/catalog.json from a build directory.
std::string read_text_file(const std::string& path);

// Writes string to file, creating parent directories if needed.
//
// Uses a temporary sibling file + rename so readers never observe a truncated file.
void write_text_file(const std::string& path, const std::string& contents);

// Appends to a file (creating it if missing). Throws std::runtime_error on failure.
void append_text_file(const std::string& path, const std::string& contents);

// Creates directory (and parents) if needed; no-op if exists.
void ensure_dir(const std::string& path);

bool file_exists(const std::string& path);

// Removes a file. Returns false if it did not exist; throws on other failures.
bool remove_file(const std::string& path);

// Regular files in `dir` whose name ends with `extension`, sorted by name.
// Missing directories yield an empty list.
std::vector<std::string> list_files(const std::string& dir, const std::string& extension);

} // namespace settlesim
