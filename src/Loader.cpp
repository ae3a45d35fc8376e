/**
 * @file Loader.cpp
 * @brief Settings file loading implementation
 */

#include "unclobber/Loader.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace unclobber {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
std::string streamed(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

/**
 * @brief Convert toml++ value to a Value.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(streamed(node.as_date()->get()));

        case toml::node_type::time:
            return Value(streamed(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(streamed(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// JSON File Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);

    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_config_file(const std::string& path) {
    // RULE F3
    if (path.empty()) {
        return Value::object();
    }

    // RULE F4
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    // RULE F5
    std::string ext = get_file_extension(path);
    Value loaded;
    if (ext == ".json") {
        loaded = load_json_file(path);
    } else if (ext == ".toml") {
        loaded = load_toml_file(path);
    } else {
        throw ConfigError(
            "Unsupported config file type: " + ext + " (expected .json or .toml)"
        );
    }

    if (!loaded.is_object()) {
        throw ConfigParseError(path, 0, 0, "root must be a table, found " + type_name(loaded));
    }
    return loaded;
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace unclobber
