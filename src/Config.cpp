#include "unclobber/Config.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Loader.hpp"
#include "unclobber/Util.hpp"

#include <algorithm>
#include <cctype>

namespace unclobber {

namespace {

// Objects merge key by key, anything else replaces.
void layer(Value& base, const Value& over) {
    if (!base.is_object() || !over.is_object()) {
        base = over;
        return;
    }
    for (auto it = over.begin(); it != over.end(); ++it) {
        if (base.contains(it.key()) && base[it.key()].is_object() && it.value().is_object()) {
            layer(base[it.key()], it.value());
        } else {
            base[it.key()] = it.value();
        }
    }
}

bool get_bool(const Config& cfg, const std::string& key, bool fallback) {
    if (!cfg.contains(key)) return fallback;
    const Value& v = cfg.at(key);
    if (!v.is_boolean()) throw TypeError(key, "boolean", type_name(v));
    return v.get<bool>();
}

std::optional<std::string> get_string(const Config& cfg, const std::string& key) {
    if (!cfg.contains(key)) return std::nullopt;
    const Value& v = cfg.at(key);
    if (v.is_null()) return std::nullopt;
    if (!v.is_string()) throw TypeError(key, "string", type_name(v));
    return v.get<std::string>();
}

// Accepts ["a", "b"] or "a,b"
std::vector<std::string> get_string_list(const Config& cfg, const std::string& key,
                                         std::vector<std::string> fallback) {
    if (!cfg.contains(key)) return fallback;
    const Value& v = cfg.at(key);
    if (v.is_string()) {
        return split(v.get<std::string>(), ',');
    }
    if (!v.is_array()) throw TypeError(key, "array", type_name(v));
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.is_string()) throw TypeError(key, "array of strings", "array of " + type_name(item));
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string normalize_extension(std::string ext) {
    ext = to_lower(trim(ext));
    if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    return ext;
}

} // anonymous namespace

Config Config::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    layer(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        layer(merged, load_config_file(*opts.file_path));
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    return cfg;
}

const Value& Config::at(const std::string& path) const {
    return get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return exists_by_dot(data_, path);
}

void Config::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Config::apply_env_prefix(const std::string& prefix) {
    // Prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) continue;

        // remainder -> lower; settings keys are flat and keep their underscores
        std::string key = to_lower(name.substr(normalized.size()));
        if (key.empty()) continue;
        set_by_dot(data_, key, parse_json_or_string(value));
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

Value default_settings() {
    Value d = Value::object();
    d["vault_path"] = nullptr;
    d["apply"] = false;
    d["assume_yes"] = false;
    d["conflict_mode"] = "automatic";
    d["date_policy"] = "latest";
    d["sort_sequences"] = true;
    d["extensions"] = Value::array({".md"});
    d["log_dir"] = "logs";
    d["verbose"] = false;
    return d;
}

Settings Settings::from_config(const Config& cfg) {
    Settings s;
    s.vault_path = get_string(cfg, "vault_path");
    s.apply = get_bool(cfg, "apply", s.apply);
    s.assume_yes = get_bool(cfg, "assume_yes", s.assume_yes);
    if (auto mode = get_string(cfg, "conflict_mode")) {
        s.conflict_mode = parse_conflict_mode(*mode);
    }
    if (auto policy = get_string(cfg, "date_policy")) {
        s.date_policy = parse_date_policy(*policy);
    }
    s.sort_sequences = get_bool(cfg, "sort_sequences", s.sort_sequences);

    std::vector<std::string> exts = get_string_list(cfg, "extensions", s.extensions);
    s.extensions.clear();
    for (auto& ext : exts) {
        std::string norm = normalize_extension(ext);
        if (!norm.empty()) s.extensions.push_back(norm);
    }
    if (s.extensions.empty()) {
        throw ConfigError("Setting 'extensions' must name at least one file extension");
    }

    if (auto dir = get_string(cfg, "log_dir")) {
        s.log_dir = *dir;
    }
    s.verbose = get_bool(cfg, "verbose", s.verbose);
    return s;
}

UnclobberOptions Settings::pipeline_options() const {
    UnclobberOptions opts;
    opts.merge.mode = conflict_mode;
    opts.merge.date_policy = date_policy;
    opts.style.sort_sequences = sort_sequences;
    return opts;
}

} // namespace unclobber
