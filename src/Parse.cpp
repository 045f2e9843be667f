/**
 * @file Parse.cpp
 * @brief Implementation of scalar inference
 */

#include "diffx/Parse.hpp"
#include "diffx/Util.hpp"
#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace diffx {

namespace {
    // -?[0-9]+
    bool is_integer_text(std::string_view s) {
        if (!s.empty() && s.front() == '-') {
            s.remove_prefix(1);
        }
        return is_digits(s);
    }

    // -?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?
    bool is_float_text(std::string_view s) {
        if (!s.empty() && s.front() == '-') {
            s.remove_prefix(1);
        }
        const std::size_t dot = s.find('.');
        if (dot == std::string_view::npos || !is_digits(s.substr(0, dot))) {
            return false;
        }
        const std::string_view rest = s.substr(dot + 1);
        const std::size_t exp = rest.find_first_of("eE");
        if (exp == std::string_view::npos) {
            return is_digits(rest);
        }
        std::string_view power = rest.substr(exp + 1);
        if (!power.empty() && (power.front() == '+' || power.front() == '-')) {
            power.remove_prefix(1);
        }
        return is_digits(rest.substr(0, exp)) && is_digits(power);
    }
}

Value parse_scalar(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    // T1: Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // T2: Null
    if (lower == "null") {
        return nullptr;
    }

    // T3: Integer
    if (is_integer_text(str)) {
        try {
            std::size_t pos = 0;
            long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
            // Too wide for int64: keep the magnitude as a double
            try {
                return std::stod(str);
            } catch (const std::out_of_range&) {
                return str;
            }
        }
    }

    // T4: Float
    if (is_float_text(str)) {
        try {
            std::size_t pos = 0;
            double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
            // Overflowing exponent: fall through to string
        }
    }

    // T5: Raw String
    return str;
}

} // namespace diffx
