/**
 * @file Loader.hpp
 * @brief Settings file loading
 *
 * Loads tool settings from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * RULE F1: Standard JSON parsing with UTF-8 encoding.
 * RULE F2: TOML 1.0 parsing; tables map to nested objects, dates and times
 *          become ISO-8601 strings.
 * RULE F3: Empty path → empty object (no file loaded).
 * RULE F4: Missing file → FileNotFoundError.
 * RULE F5: Format is chosen by extension (.json → JSON, .toml → TOML).
 */

#ifndef UNCLOBBER_LOADER_HPP
#define UNCLOBBER_LOADER_HPP

#include "unclobber/Value.hpp"

#include <optional>
#include <string>

namespace unclobber {

/**
 * @brief Load settings from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load settings from a TOML file.
 *
 * @param path Path to the TOML file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load settings from file, auto-detecting format by extension.
 *
 * @param path Path to settings file (empty string = no file)
 * @return Parsed Value object, or empty object if path is empty
 * @throws FileNotFoundError if path is non-empty and file doesn't exist
 * @throws ConfigParseError if file has syntax errors or the root is not a table
 * @throws ConfigError if extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Get environment variable value.
 *
 * @param name Variable name
 * @return Value if exists, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace unclobber

#endif // UNCLOBBER_LOADER_HPP
