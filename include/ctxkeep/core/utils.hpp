#ifndef ctxkeep_CORE_UTILS_HPP
#define ctxkeep_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace ctxkeep {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SS.mmmZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// Format a millisecond timestamp as a compact file-name stamp (YYYYMMDD_HHMMSS_mmm)
std::string format_file_stamp(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Number of UTF-8 code points in s. Stray continuation bytes are not counted.
size_t utf8_length(const std::string& s);

// First max_chars code points of s (never splits a multi-byte sequence)
std::string utf8_prefix(const std::string& s, size_t max_chars);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Create a directory and its parents
bool create_directories(const std::string& dir);

bool file_exists(const std::string& path);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest of data
std::string sha256_hex(const std::string& data);

} // namespace ctxkeep

#endif // ctxkeep_CORE_UTILS_HPP
