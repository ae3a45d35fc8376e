/**
 * @file Frontmatter.cpp
 * @brief Implementation of chunk classification
 */

#include "unclobber/Frontmatter.hpp"
#include "unclobber/Scalar.hpp"
#include "unclobber/Splitter.hpp"
#include "unclobber/Util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <regex>

namespace unclobber {

namespace {

// Tag yaml-cpp gives to quoted scalars
const char* const kNonPlainTag = "!";
const char* const kStrTag = "tag:yaml.org,2002:str";

/**
 * @brief Convert a yaml-cpp node to a Value
 * @return false if the node holds a mapping with a non-scalar key
 */
bool to_value(const YAML::Node& node, Value& out) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
            out = nullptr;
            return true;

        case YAML::NodeType::Scalar:
            if (node.Tag() == kNonPlainTag || node.Tag() == kStrTag) {
                out = node.Scalar();
            } else {
                out = parse_scalar(node.Scalar());
            }
            return true;

        case YAML::NodeType::Sequence: {
            out = Value::array();
            for (const auto& item : node) {
                Value v;
                if (!to_value(item, v)) return false;
                out.push_back(std::move(v));
            }
            return true;
        }

        case YAML::NodeType::Map: {
            out = Value::object();
            for (const auto& pair : node) {
                const YAML::Node& key = pair.first;
                std::string name;
                if (key.IsScalar()) {
                    name = key.Scalar();
                } else if (key.IsNull()) {
                    name = "null";
                } else {
                    return false;
                }
                Value v;
                if (!to_value(pair.second, v)) return false;
                out[name] = std::move(v);
            }
            return true;
        }

        default:
            return false;
    }
}

} // anonymous namespace

std::optional<Value> parse_block(const std::string& chunk) {
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(chunk);
    } catch (const YAML::Exception& e) {
        spdlog::debug("Chunk is not YAML ({}), treating it as body", e.what());
        return std::nullopt;
    }

    if (docs.size() != 1 || !docs.front().IsMap()) {
        return std::nullopt;
    }

    Value mapping;
    if (!to_value(docs.front(), mapping)) {
        spdlog::debug("Chunk has a non-scalar mapping key, treating it as body");
        return std::nullopt;
    }
    return mapping;
}

bool contains_implicit_null(const std::string& chunk, const Value& mapping) {
    const std::vector<std::string> lines = split_lines(chunk);
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        if (!it.value().is_null()) {
            continue;
        }
        const std::regex explicit_null(
            "^\\s*" + regex_escape(it.key()) + "\\s*:\\s*(null|~)\\s*$",
            std::regex_constants::ECMAScript | std::regex_constants::icase);

        bool found = false;
        for (const auto& line : lines) {
            if (std::regex_match(line, explicit_null)) {
                found = true;
                break;
            }
        }
        if (!found) {
            spdlog::debug("Key '{}' has an implicit null value", it.key());
            return true;
        }
    }
    return false;
}

std::optional<Value> classify_chunk(const std::string& chunk) {
    auto mapping = parse_block(chunk);
    if (!mapping || contains_implicit_null(chunk, *mapping)) {
        return std::nullopt;
    }
    return mapping;
}

std::string trim_body(std::string_view body) {
    // One leading blank line
    std::size_t nl = body.find('\n');
    if (nl != std::string_view::npos && trim(body.substr(0, nl)).empty()) {
        body.remove_prefix(nl + 1);
    }

    // One trailing line terminator
    if (!body.empty() && body.back() == '\n') {
        body.remove_suffix(1);
        if (!body.empty() && body.back() == '\r') {
            body.remove_suffix(1);
        }
    }
    return std::string(body);
}

Extraction extract_frontmatter(std::string_view document) {
    Extraction result;

    SplitResult split = split_candidates(document);
    if (!split.has_opening) {
        result.body = std::string(document);
        return result;
    }

    std::size_t body_offset = split.tail_offset;
    for (const auto& chunk : split.chunks) {
        auto mapping = classify_chunk(chunk.text);
        if (!mapping) {
            body_offset = chunk.offset;
            break;
        }
        result.blocks.push_back(std::move(*mapping));
    }

    result.body = trim_body(document.substr(body_offset));
    return result;
}

} // namespace unclobber
