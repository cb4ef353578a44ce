#pragma once
#include <string>

namespace agentstream {

// Trim whitespace
std::string trim(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file.
// Creates parent directories as needed. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace agentstream
