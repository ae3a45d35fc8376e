/**
 * @file Merge.cpp
 * @brief Implementation of the frontmatter merge
 */

#include "unclobber/Merge.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace unclobber {

namespace {

int type_rank(const Value& v) {
    if (v.is_null()) return 0;
    if (v.is_boolean()) return 1;
    if (v.is_number()) return 2;
    if (v.is_object()) return 3;
    if (v.is_array()) return 4;
    if (v.is_string()) return 5;
    return 6;
}

bool number_less(const Value& a, const Value& b) {
    if (a.is_number_integer() && b.is_number_integer()) {
        return a.get<std::int64_t>() < b.get<std::int64_t>();
    }
    const double da = a.get<double>();
    const double db = b.get<double>();
    if (std::isnan(da)) return false;
    if (std::isnan(db)) return true;
    return da < db;
}

/**
 * @brief RULE M2: pick the instant the policy prefers
 * @return true if incoming should replace existing
 */
bool incoming_date_wins(const Value& existing, const Value& incoming, DatePolicy policy) {
    auto e = parse_timestamp(existing.get<std::string>());
    auto n = parse_timestamp(incoming.get<std::string>());
    if (policy == DatePolicy::Latest) {
        return *e < *n;
    }
    return *n < *e;
}

} // anonymous namespace

bool value_less(const Value& a, const Value& b) {
    const int ra = type_rank(a);
    const int rb = type_rank(b);
    if (ra != rb) return ra < rb;
    if (a.is_number()) return number_less(a, b);
    return a < b;
}

Value union_sorted(const Value& a, const Value& b) {
    std::vector<Value> items;
    for (const Value* side : {&a, &b}) {
        if (side->is_array()) {
            items.insert(items.end(), side->begin(), side->end());
        } else {
            items.push_back(*side);
        }
    }

    std::sort(items.begin(), items.end(), value_less);
    items.erase(std::unique(items.begin(), items.end()), items.end());

    Value result = Value::array();
    for (auto& item : items) {
        result.push_back(std::move(item));
    }
    return result;
}

MergeResult merge_frontmatters(const std::vector<Value>& blocks, const MergeOptions& options) {
    if (options.mode == ConflictMode::Interactive && !options.resolver) {
        throw MergeError("Interactive conflict mode requires a conflict resolver");
    }

    MergeResult result;
    Value& merged = result.merged;

    for (const auto& block : blocks) {
        if (!block.is_object()) {
            throw MergeError("Frontmatter block is a " + type_name(block) + ", expected a mapping");
        }

        for (auto it = block.begin(); it != block.end(); ++it) {
            const std::string& key = it.key();
            const Value& incoming = it.value();

            // RULE M1
            auto found = merged.find(key);
            if (found == merged.end()) {
                merged[key] = incoming;
                continue;
            }

            Value& existing = *found;

            // RULE M2
            if (is_datestamp(existing) && is_datestamp(incoming)) {
                if (incoming_date_wins(existing, incoming, options.date_policy)) {
                    spdlog::debug("Date key '{}': {} replaces {} ({})", key,
                                  display(incoming), display(existing),
                                  to_string(options.date_policy));
                    existing = incoming;
                }
                continue;
            }

            // RULE M3: a mapping never joins a list
            if ((existing.is_array() || incoming.is_array()) &&
                !existing.is_object() && !incoming.is_object()) {
                existing = union_sorted(existing, incoming);
                continue;
            }

            // RULE M4
            if (existing == incoming) {
                continue;
            }

            // RULE M5
            if (options.mode == ConflictMode::Automatic) {
                result.conflicts.push_back({key, existing, incoming});
                existing = incoming;
                continue;
            }

            switch (options.resolver(key, existing, incoming)) {
                case ConflictChoice::KeepExisting:
                    result.conflicts.push_back({key, incoming, existing});
                    break;
                case ConflictChoice::TakeIncoming:
                    result.conflicts.push_back({key, existing, incoming});
                    existing = incoming;
                    break;
                case ConflictChoice::Skip:
                    spdlog::debug("Merge skipped at key '{}'", key);
                    result.skipped = true;
                    return result;
            }
        }
    }

    return result;
}

ConflictMode parse_conflict_mode(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "automatic") return ConflictMode::Automatic;
    if (lower == "interactive") return ConflictMode::Interactive;
    throw ConfigError("Unknown conflict mode '" + name + "' (expected automatic or interactive)");
}

std::string to_string(ConflictMode mode) {
    return mode == ConflictMode::Interactive ? "interactive" : "automatic";
}

} // namespace unclobber
