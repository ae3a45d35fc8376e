/**
 * @file Files.hpp
 * @brief Document discovery and file IO for the command-line tool
 */

#ifndef UNCLOBBER_FILES_HPP
#define UNCLOBBER_FILES_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace unclobber {

namespace fs = std::filesystem;

/**
 * @brief Check that a directory can be scanned and rewritten
 * @throws IoError if root is missing, not a directory, or not readable and
 *         writable
 */
void validate_directory(const fs::path& root);

/**
 * @brief Recursively find documents below root
 *
 * @param root Directory to scan
 * @param extensions Lowercase extensions including the dot (e.g. ".md");
 *        file extensions are compared case-insensitively
 * @return Regular files, sorted by path
 * @throws IoError if the directory cannot be iterated
 */
std::vector<fs::path> find_documents(const fs::path& root,
                                     const std::vector<std::string>& extensions);

/**
 * @brief Read a whole file
 * @throws IoError if the file cannot be opened or read
 */
std::string read_file_bytes(const fs::path& path);

/**
 * @brief Read a document as UTF-8 text
 * @return The text, or std::nullopt if the bytes are not valid UTF-8
 * @throws IoError if the file cannot be read
 */
std::optional<std::string> read_document(const fs::path& path);

/**
 * @brief Overwrite a file with new content
 * @throws IoError on failure
 */
void write_document(const fs::path& path, const std::string& content);

/**
 * @brief Copy a file into a backup directory
 *
 * The path relative to root is kept, so equal file names in different
 * folders do not overwrite each other.
 *
 * @return Path of the copy
 * @throws IoError on failure
 */
fs::path backup_file(const fs::path& file, const fs::path& root, const fs::path& backup_dir);

} // namespace unclobber

#endif // UNCLOBBER_FILES_HPP
