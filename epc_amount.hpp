/**
 * epc qr payload - version 1.00
 * --------------------------------------------------------
 * SEPA credit transfer payloads (EPC "BCD" QR code) for banking apps
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include "epc_model.hpp"
#include "epc_checksum.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>
#include <limits>
#include <iomanip>
#include <sstream>

namespace epc {

// Strict payload amount: "<1-9 digits>.<2 digits>", 0.01 .. 999999999.99.
inline bool is_valid_amount(std::string_view s) {
    size_t dot = std::string_view::npos;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '.') {
            if (dot != std::string_view::npos) return false; // second '.'
            dot = i;
        } else if (!is_digit_ascii(c)) {
            return false;
        }
    }
    if (dot == std::string_view::npos) return false;

    std::string_view intp = s.substr(0, dot);
    std::string_view frac = s.substr(dot + 1);
    if (intp.empty() || intp.size() > kAmountMaxIntegerDigits) return false;
    if (frac.size() != 2) return false;

    for (unsigned char c : intp) if (c != '0') return true;
    for (unsigned char c : frac) if (c != '0') return true;
    return false; // 0.00
}

// 1234 -> "12.34"
inline std::optional<std::string> amount_from_minor(std::int64_t minor) {
    if (minor < kAmountMinMinor || minor > kAmountMaxMinor) return std::nullopt;
    std::ostringstream oss;
    oss << (minor / 100) << '.' << std::setw(2) << std::setfill('0') << (minor % 100);
    return oss.str();
}

// Lenient decimal input ("12", "12.5", "12,50", " 3.00 ") -> minor units (cents).
// Rejects signs, grouping, more than two decimals and overflow; no rounding.
inline bool decimal_to_minor(std::string_view in, std::int64_t& out) {
    size_t b = 0, e = in.size();
    while (b < e && is_space_ascii(static_cast<unsigned char>(in[b]))) ++b;
    while (e > b && is_space_ascii(static_cast<unsigned char>(in[e-1]))) --e;
    std::string_view s = in.substr(b, e - b);
    if (s.empty()) return false;

    size_t sep = s.find_first_of(".,");
    std::string_view intp = s.substr(0, sep);
    std::string_view frac = sep == std::string_view::npos ? std::string_view() : s.substr(sep + 1);
    if (intp.empty() || frac.size() > 2) return false;
    if (sep != std::string_view::npos && frac.empty()) return false;

    std::int64_t major = 0;
    for (unsigned char c : intp) {
        if (!is_digit_ascii(c)) return false;
        if (major > (std::numeric_limits<std::int64_t>::max() / 1000)) return false;
        major = major * 10 + (c - '0');
    }
    std::int64_t cents = 0;
    for (size_t i = 0; i < 2; ++i) {
        cents *= 10;
        if (i < frac.size()) {
            unsigned char c = static_cast<unsigned char>(frac[i]);
            if (!is_digit_ascii(c)) return false;
            cents += c - '0';
        }
    }
    out = major * 100 + cents;
    return true;
}

} // namespace epc
