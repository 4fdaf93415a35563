#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace covmap::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();  // "20261019T101500Z-3fa92c01" (UTC, random suffix)

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
bool is_executable_file(const fs::path& path);
std::optional<fs::path> find_in_path(const std::string& program);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string shell_quote(const std::string& s);
std::string xml_escape(const std::string& s);

// Fixed-point formatting with trailing zeros stripped ("906.875", "100", "-76.964072").
std::string format_number(double value, int max_decimals = 6);

// Shortest decimal text that parses back to the same double ("40.2644447777", "2e-07").
std::string format_exact(double value);

} // namespace covmap::core
