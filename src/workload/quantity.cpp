/**
 * @file quantity.cpp
 * @brief Quantity parsing with exact decimal arithmetic.
 * @author Dimitris Kafetzis
 *
 * Fractions are kept as digit strings and scaled with integer math, rounding
 * up to the next whole unit, so "0.0001" CPU becomes 1m rather than 0m.
 */

#include "workload/quantity.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace cluster_gate {

namespace {

constexpr uint64_t MAX_U64 = std::numeric_limits<uint64_t>::max();

struct Decimal {
    uint64_t whole = 0;
    std::string fraction;   ///< Digits after the point, may be empty
};

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<Decimal> parse_decimal(std::string_view text) {
    Decimal d;
    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    if (whole.empty()) whole = "0";
    if (!all_digits(whole)) return std::nullopt;

    for (char c : whole) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (d.whole > (MAX_U64 - digit) / 10) return std::nullopt;
        d.whole = d.whole * 10 + digit;
    }

    if (dot != std::string_view::npos) {
        auto frac = text.substr(dot + 1);
        if (!frac.empty() && !all_digits(frac)) return std::nullopt;
        if (frac.empty() && dot == 0) return std::nullopt;   // "."
        d.fraction = std::string{frac};
    }
    return d;
}

/// d × multiplier, rounded up. nullopt on overflow.
std::optional<uint64_t> scale(const Decimal& d, uint64_t multiplier) {
    if (d.whole != 0 && d.whole > MAX_U64 / multiplier) return std::nullopt;
    uint64_t result = d.whole * multiplier;

    if (d.fraction.empty()) return result;

    // fraction × multiplier / 10^digits, computed digit by digit.
    unsigned __int128 numerator = 0;
    unsigned __int128 denominator = 1;
    for (char c : d.fraction) {
        if (denominator >= 1000000000000000000ULL) break;   // 18 digits is all we keep
        numerator = numerator * 10 + static_cast<unsigned>(c - '0');
        denominator *= 10;
    }
    unsigned __int128 scaled = numerator * multiplier;
    uint64_t part = static_cast<uint64_t>(scaled / denominator);
    if (scaled % denominator != 0) ++part;

    if (result > MAX_U64 - part) return std::nullopt;
    return result + part;
}

Result<uint64_t> number_to_units(const nlohmann::json& value, uint64_t multiplier,
                                 std::string_view what) {
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v != 0 && v > MAX_U64 / multiplier) {
            return Error{ErrorCode::InvalidArgument, std::string{what} + " quantity overflows"};
        }
        return v * multiplier;
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < 0) return Error{ErrorCode::InvalidArgument, std::string{what} + " quantity is negative"};
        return number_to_units(nlohmann::json(static_cast<uint64_t>(v)), multiplier, what);
    }
    auto v = value.get<double>();
    if (!std::isfinite(v) || v < 0.0) {
        return Error{ErrorCode::InvalidArgument, std::string{what} + " quantity is not a valid number"};
    }
    long double scaled = std::ceil(static_cast<long double>(v) * multiplier);
    if (scaled > static_cast<long double>(MAX_U64)) {
        return Error{ErrorCode::InvalidArgument, std::string{what} + " quantity overflows"};
    }
    return static_cast<uint64_t>(scaled);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// CPU
// ─────────────────────────────────────────────

Result<uint64_t> parse_cpu_millis(std::string_view text) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty cpu quantity"};
    }

    if (text.back() == 'm') {
        auto digits = text.substr(0, text.size() - 1);
        auto d = parse_decimal(digits);
        if (!d || !d->fraction.empty()) {
            return Error{ErrorCode::InvalidArgument, "invalid cpu quantity '" + std::string{text} + "'"};
        }
        return d->whole;
    }

    auto d = parse_decimal(text);
    if (!d) {
        return Error{ErrorCode::InvalidArgument, "invalid cpu quantity '" + std::string{text} + "'"};
    }
    auto millis = scale(*d, 1000);
    if (!millis) {
        return Error{ErrorCode::InvalidArgument, "cpu quantity '" + std::string{text} + "' overflows"};
    }
    return *millis;
}

Result<uint64_t> cpu_millis_from_json(const nlohmann::json& quantity) {
    if (quantity.is_string()) return parse_cpu_millis(std::string_view{quantity.get_ref<const std::string&>()});
    if (quantity.is_number()) return number_to_units(quantity, 1000, "cpu");
    return Error{ErrorCode::InvalidArgument, "cpu quantity must be a string or number"};
}

// ─────────────────────────────────────────────
// Memory
// ─────────────────────────────────────────────

Result<uint64_t> parse_memory_bytes(std::string_view text) {
    static constexpr std::array<std::pair<std::string_view, uint64_t>, 11> SUFFIXES{{
        {"Ki", 1ULL << 10}, {"Mi", 1ULL << 20}, {"Gi", 1ULL << 30},
        {"Ti", 1ULL << 40}, {"Pi", 1ULL << 50},
        {"k", 1000ULL}, {"K", 1000ULL}, {"M", 1000ULL * 1000},
        {"G", 1000ULL * 1000 * 1000}, {"T", 1000ULL * 1000 * 1000 * 1000},
        {"P", 1000ULL * 1000 * 1000 * 1000 * 1000},
    }};

    if (text.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty memory quantity"};
    }

    uint64_t multiplier = 1;
    std::string_view digits = text;
    for (const auto& [suffix, mult] : SUFFIXES) {
        if (text.size() > suffix.size() && text.ends_with(suffix)) {
            multiplier = mult;
            digits = text.substr(0, text.size() - suffix.size());
            break;
        }
    }

    auto d = parse_decimal(digits);
    if (!d) {
        return Error{ErrorCode::InvalidArgument, "invalid memory quantity '" + std::string{text} + "'"};
    }
    auto bytes = scale(*d, multiplier);
    if (!bytes) {
        return Error{ErrorCode::InvalidArgument, "memory quantity '" + std::string{text} + "' overflows"};
    }
    return *bytes;
}

Result<uint64_t> memory_bytes_from_json(const nlohmann::json& quantity) {
    if (quantity.is_string()) return parse_memory_bytes(std::string_view{quantity.get_ref<const std::string&>()});
    if (quantity.is_number()) return number_to_units(quantity, 1, "memory");
    return Error{ErrorCode::InvalidArgument, "memory quantity must be a string or number"};
}

// ─────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────

std::string format_cpu_millis(uint64_t millis) {
    if (millis % 1000 == 0) return std::to_string(millis / 1000);
    return std::to_string(millis) + "m";
}

std::string format_memory_bytes(uint64_t bytes) {
    static constexpr std::array<std::pair<const char*, uint64_t>, 4> UNITS{{
        {"Ti", 1ULL << 40}, {"Gi", 1ULL << 30}, {"Mi", 1ULL << 20}, {"Ki", 1ULL << 10},
    }};
    for (const auto& [suffix, unit] : UNITS) {
        if (bytes >= unit && bytes % unit == 0) {
            return std::to_string(bytes / unit) + suffix;
        }
    }
    return std::to_string(bytes);
}

}  // namespace cluster_gate
