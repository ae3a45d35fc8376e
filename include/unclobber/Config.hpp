#ifndef UNCLOBBER_CONFIG_HPP
#define UNCLOBBER_CONFIG_HPP

#include "unclobber/DateStamp.hpp"
#include "unclobber/Merge.hpp"
#include "unclobber/Unclobber.hpp"
#include "unclobber/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace unclobber {

/// Environment prefix for settings, e.g. UNCLOBBER_DATE_POLICY=earliest
inline constexpr const char* kEnvPrefix = "UNCLOBBER";

/// Environment variable naming the default directory to scan
inline constexpr const char* kVaultPathEnv = "VAULT_PATH";

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "UNCLOBBER"
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = Value::object();
};

/**
 * @brief Layered settings tree with dot-notation helpers.
 *
 * Internally uses a Value to represent a hierarchical tree.
 */
class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    // Dot helpers
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

private:
    Value data_ = Value::object();
};

/**
 * @brief Built-in defaults, the lowest settings layer
 *
 * Keys: vault_path, apply, assume_yes, conflict_mode, date_policy,
 * sort_sequences, extensions, log_dir, verbose.
 */
Value default_settings();

/**
 * @brief Typed view of the merged settings
 */
struct Settings {
    std::optional<std::string> vault_path;
    bool apply = false;
    bool assume_yes = false;
    ConflictMode conflict_mode = ConflictMode::Automatic;
    DatePolicy date_policy = DatePolicy::Latest;
    bool sort_sequences = true;
    std::vector<std::string> extensions = {".md"};
    std::string log_dir = "logs";
    bool verbose = false;

    /**
     * @brief Read settings from a loaded Config
     * @throws TypeError if a key holds a value of the wrong type
     * @throws ConfigError for unknown mode or policy names
     */
    static Settings from_config(const Config& cfg);

    /**
     * @brief Pipeline options for these settings (no resolver attached)
     */
    UnclobberOptions pipeline_options() const;
};

} // namespace unclobber

#endif // UNCLOBBER_CONFIG_HPP
