#ifndef sandterm_CORE_UTILS_HPP
#define sandterm_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace sandterm {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (deadlines, idle accounting)
int64_t monotonic_ms();

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Replace invalid UTF-8 sequences so the text can be serialized as JSON.
// Tab, newline, carriage return and ESC (terminal colours) are kept.
std::string sanitize_utf8(const std::string& s);

// Wrap a string in single quotes for /bin/sh
std::string shell_quote(const std::string& s);

// ============ Path utilities ============

// Normalize path (resolve . and .., collapse repeated separators)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// True when `path` equals `root` or lies beneath it (string prefix on a segment boundary)
bool path_within(const std::string& path, const std::string& root);

// mkdir -p
bool create_directories(const std::string& path, unsigned int mode = 0755);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ Identifier utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace sandterm

#endif // sandterm_CORE_UTILS_HPP
