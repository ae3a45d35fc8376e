/**
 * @file Files.cpp
 * @brief Document discovery and file IO implementation
 */

#include "unclobber/Files.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#ifdef _WIN32
    #include <io.h>
#else
    #include <unistd.h>
#endif

namespace unclobber {

void validate_directory(const fs::path& root) {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw IoError(root.string(), "Directory does not exist");
    }
    if (!fs::is_directory(root, ec)) {
        throw IoError(root.string(), "Path is not a directory");
    }
#ifdef _WIN32
    const bool accessible = _access(root.string().c_str(), 06) == 0;
#else
    const bool accessible = access(root.c_str(), R_OK | W_OK) == 0;
#endif
    if (!accessible) {
        throw IoError(root.string(), "Directory is not readable/writable");
    }
}

std::vector<fs::path> find_documents(const fs::path& root,
                                     const std::vector<std::string>& extensions) {
    spdlog::info("Searching for documents in {}...", root.string());

    std::vector<fs::path> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw IoError(root.string(), "Cannot scan directory (" + ec.message() + ")");
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            throw IoError(root.string(), "Cannot scan directory (" + ec.message() + ")");
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        const std::string ext = to_lower(it->path().extension().string());
        if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
            files.push_back(it->path());
        }
    }

    std::sort(files.begin(), files.end());
    spdlog::info("Found {} documents.", files.size());
    return files;
}

std::string read_file_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(path.string(), "Cannot open file");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IoError(path.string(), "Cannot read file");
    }
    return ss.str();
}

std::optional<std::string> read_document(const fs::path& path) {
    std::string bytes = read_file_bytes(path);
    if (!is_valid_utf8(bytes)) {
        return std::nullopt;
    }
    return bytes;
}

void write_document(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw IoError(path.string(), "Cannot open for write");
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
        throw IoError(path.string(), "Cannot write file");
    }
}

fs::path backup_file(const fs::path& file, const fs::path& root, const fs::path& backup_dir) {
    std::error_code ec;
    fs::path relative = fs::relative(file, root, ec);
    if (ec || relative.empty() || *relative.begin() == "..") {
        relative = file.filename();
    }

    fs::path target = backup_dir / relative;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw IoError(target.parent_path().string(),
                      "Cannot create backup directory (" + ec.message() + ")");
    }

    fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw IoError(file.string(), "Cannot back up file (" + ec.message() + ")");
    }

    // Backups carry the original modification time
    fs::file_time_type modified = fs::last_write_time(file, ec);
    if (!ec) {
        fs::last_write_time(target, modified, ec);
    }
    if (ec) {
        throw IoError(target.string(), "Cannot set backup modification time (" + ec.message() + ")");
    }
    return target;
}

} // namespace unclobber
