/**
 * @file Scalar.cpp
 * @brief Implementation of plain scalar typing
 */

#include "unclobber/Scalar.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <regex>

namespace unclobber {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("^[-+]?(0|[1-9][0-9]*)$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re(
            "^[-+]?(0|[1-9][0-9]*)((\\.[0-9]+)([eE][-+]?[0-9]+)?|[eE][-+]?[0-9]+)$");
        return re;
    }

    bool is_null_literal(const std::string& str) {
        return str.empty() || str == "~" || str == "null" || str == "Null" || str == "NULL";
    }
}

Value parse_scalar(const std::string& str) {
    // S1: Null
    if (is_null_literal(str)) {
        return nullptr;
    }

    // S2: Boolean
    if (str == "true" || str == "True" || str == "TRUE") {
        return true;
    }
    if (str == "false" || str == "False" || str == "FALSE") {
        return false;
    }

    // S3: Integer
    if (std::regex_match(str, integer_pattern())) {
        errno = 0;
        char* end = nullptr;
        long long val = std::strtoll(str.c_str(), &end, 10);
        // Out of range: keep the digits as text rather than lose precision
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return static_cast<std::int64_t>(val);
        }
        return str;
    }

    // S4: Float
    if (std::regex_match(str, float_pattern())) {
        errno = 0;
        char* end = nullptr;
        double val = std::strtod(str.c_str(), &end);
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return val;
        }
        return str;
    }

    // S5: Special floats
    if (str == ".inf" || str == ".Inf" || str == ".INF" ||
        str == "+.inf" || str == "+.Inf" || str == "+.INF") {
        return std::numeric_limits<double>::infinity();
    }
    if (str == "-.inf" || str == "-.Inf" || str == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if (str == ".nan" || str == ".NaN" || str == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }

    // S6: String
    return str;
}

bool reads_back_as_string(const std::string& str) {
    return parse_scalar(str).is_string();
}

} // namespace unclobber
