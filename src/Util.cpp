#include "unclobber/Util.hpp"
#include "unclobber/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace unclobber {

static const Value& get_obj_child(const Value& obj, const std::string& path, const std::string& key) {
    if (!obj.is_object())
        throw TypeError(path, "object", type_name(obj));
    auto it = obj.find(key);
    if (it == obj.end())
        throw KeyError(path, key);
    return *it;
}

const Value& get_by_dot(const Value& obj, const std::string& path) {
    const Value* cur = &obj;
    for (const auto& token : split(path, '.')) {
        cur = &get_obj_child(*cur, path, token);
    }
    return *cur;
}

bool exists_by_dot(const Value& obj, const std::string& path) {
    const Value* cur = &obj;
    for (const auto& token : split(path, '.')) {
        if (!cur->is_object()) return false;
        auto it = cur->find(token);
        if (it == cur->end()) return false;
        cur = &*it;
    }
    return true;
}

void set_by_dot(Value& obj, const std::string& path, const Value& value) {
    std::vector<std::string> parts = split(path, '.');
    if (parts.empty()) return;
    Value* cur = &obj;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto& p = parts[i];
        if (!(*cur).contains(p) || !(*cur)[p].is_object()) {
            (*cur)[p] = Value::object();
        }
        cur = &(*cur)[p];
    }
    (*cur)[parts.back()] = value;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t nl = text.find('\n', pos);
        size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

std::string normalize_newlines(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') continue;
        out.push_back(text[i]);
    }
    return out;
}

std::string regex_escape(const std::string& s) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        const auto c = static_cast<unsigned char>(bytes[i]);
        size_t len = 0;
        unsigned cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false; // overlong
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
    LPCH env = GetEnvironmentStringsA();
    if (!env) return envs;
    for (LPSTR var = (LPSTR)env; *var != '\0'; var += std::strlen(var) + 1) {
        std::string entry(var);
        auto pos = entry.find('=');
        if (pos == std::string::npos) continue;
        envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
    }
    FreeEnvironmentStringsA(env);
#else
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0,pos), entry.substr(pos+1));
        }
    }
#endif
    return envs;
}

Value parse_json_or_string(const std::string& raw) {
    try {
        return Value::parse(raw);
    } catch (const nlohmann::json::parse_error&) {
        // Bare words (e.g. "earliest") are plain strings
        return Value(raw);
    }
}

} // namespace unclobber
