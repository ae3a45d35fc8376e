#ifndef UNCLOBBER_UTIL_HPP
#define UNCLOBBER_UTIL_HPP

#include "unclobber/Value.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unclobber {

// Set a nested value by dot-notation, creating intermediate objects.
void set_by_dot(Value& obj, const std::string& path, const Value& value);

// Get a nested value by dot-notation. Throws KeyError / TypeError.
const Value& get_by_dot(const Value& obj, const std::string& path);

// Check existence of a nested key by dot-notation.
bool exists_by_dot(const Value& obj, const std::string& path);

// Helpers
std::string to_lower(std::string s);
std::string trim(std::string_view s);
std::vector<std::string> split(const std::string& s, char delim);

// Split on '\n', dropping a trailing '\r' from each line. A final
// unterminated line is included; a trailing newline adds no empty line.
std::vector<std::string> split_lines(std::string_view text);

// Replace every "\r\n" with "\n". A lone '\r' is kept.
std::string normalize_newlines(std::string_view text);

// Escape every ECMAScript regex metacharacter in s.
std::string regex_escape(const std::string& s);

// True if bytes form well-formed UTF-8 (no overlongs, no surrogates).
bool is_valid_utf8(std::string_view bytes);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw);

} // namespace unclobber

#endif // UNCLOBBER_UTIL_HPP
