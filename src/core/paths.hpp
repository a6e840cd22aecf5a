#pragma once
#include <filesystem>
#include <vector>

namespace conclave::core::paths {

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Roots searched for the .env file: cwd and its parents, then the executable's.
std::vector<std::filesystem::path> project_search_paths();

// Create the parent directory of `file` if missing. Returns false on failure.
bool ensure_parent_dir(const std::filesystem::path& file);

} // namespace conclave::core::paths
