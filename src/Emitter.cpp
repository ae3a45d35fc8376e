/**
 * @file Emitter.cpp
 * @brief Implementation of the canonical re-emitter
 */

#include "unclobber/Emitter.hpp"
#include "unclobber/Errors.hpp"
#include "unclobber/Merge.hpp"
#include "unclobber/Scalar.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace unclobber {

namespace {

std::string float_text(double d) {
    if (std::isnan(d)) return ".nan";
    if (std::isinf(d)) return d > 0 ? ".inf" : "-.inf";
    // nlohmann prints the shortest text that reads back to the same double
    return Value(d).dump();
}

void emit_value(YAML::Emitter& out, const Value& v, const std::string& key,
                const EmitStyle& style, bool top_level) {
    switch (v.type()) {
        case Value::value_t::null:
            out << YAML::Null;
            break;

        case Value::value_t::boolean:
            out << v.get<bool>();
            break;

        case Value::value_t::number_integer:
            out << v.get<std::int64_t>();
            break;

        case Value::value_t::number_unsigned:
            out << v.get<std::uint64_t>();
            break;

        case Value::value_t::number_float:
            out << float_text(v.get<double>());
            break;

        case Value::value_t::string: {
            const auto& s = v.get_ref<const std::string&>();
            if (reads_back_as_string(s)) {
                out << s;
            } else {
                out << YAML::DoubleQuoted << s;
            }
            break;
        }

        case Value::value_t::array: {
            std::vector<Value> items(v.begin(), v.end());
            if (top_level && style.sort_sequences) {
                std::stable_sort(items.begin(), items.end(), value_less);
            }
            out << YAML::BeginSeq;
            for (const auto& item : items) {
                emit_value(out, item, key, style, false);
            }
            out << YAML::EndSeq;
            break;
        }

        case Value::value_t::object:
            out << YAML::BeginMap;
            for (auto it = v.begin(); it != v.end(); ++it) {
                out << YAML::Key << it.key() << YAML::Value;
                emit_value(out, it.value(), key, style, false);
            }
            out << YAML::EndMap;
            break;

        default:
            throw SerializationError(key, "unsupported value type '" + type_name(v) + "'");
    }

    if (!out.good()) {
        throw SerializationError(key, out.GetLastError());
    }
}

} // anonymous namespace

std::string emit_block(const Value& mapping, const EmitStyle& style) {
    if (!mapping.is_object()) {
        throw SerializationError("", "root is a " + type_name(mapping) + ", expected a mapping");
    }

    YAML::Emitter out;
    out.SetIndent(style.indent);
    out.SetNullFormat(YAML::TildeNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetOutputCharset(YAML::EmitNonAscii);

    out << YAML::BeginMap;
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        out << YAML::Key << it.key() << YAML::Value;
        emit_value(out, it.value(), it.key(), style, true);
    }
    out << YAML::EndMap;

    if (!out.good()) {
        throw SerializationError("", out.GetLastError());
    }

    std::string text(out.c_str(), out.size());
    if (text.empty() || text.back() != '\n') {
        text += '\n';
    }
    return text;
}

std::string assemble_document(const Value& mapping, const std::string& body,
                              const EmitStyle& style) {
    std::string doc = "---\n";
    doc += emit_block(mapping, style);
    doc += "---\n\n";
    doc += body;
    doc += "\n";
    return doc;
}

} // namespace unclobber
