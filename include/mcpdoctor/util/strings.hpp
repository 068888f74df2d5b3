#pragma once
#include <string>
#include <vector>

namespace mcpdoctor::util
{

std::string to_lower(std::string s);
std::string trim(const std::string& s);

/// Case-insensitive substring test.
bool contains_ci(const std::string& haystack, const std::string& needle);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

/// Split on a literal separator (no trimming).
std::vector<std::string> split(const std::string& s, const std::string& sep);

/// POSIX-shell-like word splitting: whitespace separates words, single quotes
/// are literal, double quotes allow backslash escapes of \ " $ `, a bare
/// backslash escapes the next character.
/// @throws std::invalid_argument on an unterminated quote
std::vector<std::string> shell_split(const std::string& command);

/// Join words back into a display string (for logs only).
std::string join(const std::vector<std::string>& words, const std::string& sep = " ");

} // namespace mcpdoctor::util
