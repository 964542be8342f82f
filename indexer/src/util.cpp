#include "util.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int get_env_int(const std::string& name, int default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(fmt::format("Invalid integer value for env var {}: {}", name, value));
    }
}

double get_env_double(const std::string& name, double default_value) {
    const char* value = std::getenv(name.c_str());
    if (!value || std::string(value).empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(fmt::format("Invalid numeric value for env var {}: {}", name, value));
    }
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.length() >= prefix.length() &&
           str.compare(0, prefix.length(), prefix) == 0;
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

namespace {

std::string strip_hex_prefix(const std::string& hex) {
    if (starts_with(hex, "0x") || starts_with(hex, "0X")) {
        return hex.substr(2);
    }
    return hex;
}

int hex_digit_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

int64_t parse_hex_quantity(const std::string& hex) {
    std::string digits = strip_hex_prefix(hex);
    if (digits.empty() || digits.size() > 15) {
        throw std::invalid_argument("Invalid hex quantity: " + hex);
    }

    int64_t value = 0;
    for (char c : digits) {
        int d = hex_digit_value(c);
        if (d < 0) {
            throw std::invalid_argument("Invalid hex quantity: " + hex);
        }
        value = value * 16 + d;
    }
    return value;
}

std::string hex_to_decimal(const std::string& hex) {
    std::string digits = strip_hex_prefix(hex);
    if (digits.empty()) {
        throw std::invalid_argument("Invalid hex quantity: " + hex);
    }

    // Little-endian limbs in base 1e9
    const uint64_t base = 1000000000ULL;
    std::vector<uint64_t> limbs{0};

    for (char c : digits) {
        int d = hex_digit_value(c);
        if (d < 0) {
            throw std::invalid_argument("Invalid hex quantity: " + hex);
        }
        uint64_t carry = static_cast<uint64_t>(d);
        for (auto& limb : limbs) {
            uint64_t v = limb * 16 + carry;
            limb = v % base;
            carry = v / base;
        }
        while (carry > 0) {
            limbs.push_back(carry % base);
            carry /= base;
        }
    }

    std::stringstream ss;
    ss << limbs.back();
    for (auto it = limbs.rbegin() + 1; it != limbs.rend(); ++it) {
        ss << std::setfill('0') << std::setw(9) << *it;
    }
    return ss.str();
}

double raw_units_to_double(const std::string& raw, int decimals) {
    if (raw.empty()) {
        throw std::invalid_argument("Empty raw amount");
    }

    long double acc = 0.0L;
    for (char c : raw) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid raw amount: " + raw);
        }
        acc = acc * 10.0L + static_cast<long double>(c - '0');
    }
    return static_cast<double>(acc / std::pow(10.0L, decimals));
}

} // namespace util
