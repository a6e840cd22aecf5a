#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace conclave::core::config {

// Load environment variables from a .env file (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Numeric lookups. Missing keys yield nullopt; malformed values are logged and yield nullopt.
std::optional<long long> get_env_int(const std::string& key);
std::optional<double> get_env_double(const std::string& key);

} // namespace conclave::core::config
