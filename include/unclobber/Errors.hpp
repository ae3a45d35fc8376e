/**
 * @file Errors.hpp
 * @brief Exception types for unclobber
 *
 * Error taxonomy:
 * - UnclobberError: Base class
 * - SerializationError: Merged mapping cannot be written back as YAML
 * - MergeError: Merge cannot run with the given options
 * - IoError: Reading, writing or backing up a document failed
 * - ConfigError: Base class for settings problems
 * - FileNotFoundError: Config file not found
 * - ConfigParseError: JSON/TOML syntax errors in a config file
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container, or wrong setting type
 *
 * A chunk that fails to parse as YAML is not an error: it marks the start
 * of the document body and is handled inside the validator.
 */

#ifndef UNCLOBBER_ERRORS_HPP
#define UNCLOBBER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace unclobber {

/**
 * @brief Base class for all unclobber exceptions
 */
class UnclobberError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A merged value has no YAML representation
 *
 * Fatal for the document being processed, and reported separately from
 * "no change needed" so callers never drop data silently.
 */
class SerializationError : public UnclobberError {
public:
    /**
     * @brief Construct with the offending key and details
     * @param key Top-level key whose value failed to serialize (may be empty)
     * @param details Emitter or type diagnostic
     */
    SerializationError(std::string key, std::string details)
        : UnclobberError(key.empty()
                         ? "Cannot serialize frontmatter: " + details
                         : "Cannot serialize frontmatter key '" + key + "': " + details)
        , key_(std::move(key))
        , details_(std::move(details))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string key_;
    std::string details_;
};

/**
 * @brief Merge options are unusable (e.g. interactive mode without a resolver)
 */
class MergeError : public UnclobberError {
public:
    using UnclobberError::UnclobberError;
};

/**
 * @brief Reading, writing or backing up a document failed
 */
class IoError : public UnclobberError {
public:
    IoError(std::string path, const std::string& details)
        : UnclobberError(details + ": " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Base class for settings errors
 */
class ConfigError : public UnclobberError {
public:
    using UnclobberError::UnclobberError;
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line of the error, 0 if unknown
     * @param column 1-based column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ConfigError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "log.dir")
     * @param segment The specific segment that doesn't exist (e.g., "dir")
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch in a configuration tree
 *
 * Raised when traversing into a non-object, or when a setting holds a
 * value of the wrong type (e.g. `extensions = 3`).
 */
class TypeError : public ConfigError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full dot-path being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Expected " + expected + " but found " + actual +
                      " at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace unclobber

#endif // UNCLOBBER_ERRORS_HPP
