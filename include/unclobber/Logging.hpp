/**
 * @file Logging.hpp
 * @brief spdlog setup for the command-line tool
 */

#ifndef UNCLOBBER_LOGGING_HPP
#define UNCLOBBER_LOGGING_HPP

#include <filesystem>
#include <string>

namespace unclobber {

/**
 * @brief Install the default logger for one run
 *
 * Creates `<log_root>/<name>-YYYYmmdd-HHMMSS/` and logs to two sinks:
 * colored stderr at info (debug when verbose) and `out.log` in that
 * directory at debug. The run directory also receives backups.
 *
 * @param log_root Parent directory for run directories
 * @param name Run name prefix (e.g. "unclobber")
 * @param verbose Show debug messages on stderr
 * @return The run directory
 * @throws IoError if the directory cannot be created
 */
std::filesystem::path setup_logging(const std::filesystem::path& log_root,
                                    const std::string& name, bool verbose);

} // namespace unclobber

#endif // UNCLOBBER_LOGGING_HPP
