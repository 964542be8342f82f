#pragma once
#include <string>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int get_env_int(const std::string& name, int default_value);
double get_env_double(const std::string& name, double default_value);

// String utilities
std::string to_lower(std::string str);
std::string to_upper(std::string str);
bool starts_with(const std::string& str, const std::string& prefix);

// Time utilities
int64_t now_ms();
std::string current_iso8601();

// Hex quantities as returned by EVM JSON-RPC ("0x1b4").
// Throws std::invalid_argument on malformed input.
int64_t parse_hex_quantity(const std::string& hex);

// Arbitrary-width hex quantity to its base-10 digits, e.g. wei values above 2^64.
std::string hex_to_decimal(const std::string& hex);

// Raw integer units (decimal string) scaled down by 10^decimals.
double raw_units_to_double(const std::string& raw, int decimals);

} // namespace util
