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
#include <string>
#include <string_view>
#include <optional>

namespace epc {

// ---------- ASCII helpers (locale independent, only classic loops) ----------
inline bool is_upper_ascii(unsigned char c) { return c >= 'A' && c <= 'Z'; }
inline bool is_digit_ascii(unsigned char c) { return c >= '0' && c <= '9'; }
inline bool is_space_ascii(unsigned char c) {
    return c==' ' || c=='\t' || c=='\n' || c=='\r' || c=='\v' || c=='\f';
}

inline std::string strip_spaces(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        if (!is_space_ascii(c)) out.push_back(static_cast<char>(c));
    return out;
}

inline bool all_upper_alnum(std::string_view s) {
    for (unsigned char c : s)
        if (!is_upper_ascii(c) && !is_digit_ascii(c)) return false;
    return true;
}

// ISO 7064 MOD 97-10 over the rearranged identifier (first 4 chars moved to the end,
// A=10 .. Z=35). Reduces incrementally, so the length of the input does not matter.
// Expects uppercase letters and digits only, length >= 5.
inline unsigned mod97(std::string_view s) {
    unsigned acc = 0;
    auto feed = [&acc](unsigned char c) {
        if (is_digit_ascii(c)) acc = (acc * 10u + static_cast<unsigned>(c - '0')) % 97u;
        else acc = (acc * 100u + static_cast<unsigned>(c - 'A' + 10)) % 97u;
    };
    for (size_t i = 4; i < s.size(); ++i) feed(static_cast<unsigned char>(s[i]));
    for (size_t i = 0; i < 4 && i < s.size(); ++i) feed(static_cast<unsigned char>(s[i]));
    return acc;
}

// IBAN (ISO 13616). Whitespace anywhere is ignored.
inline bool is_valid_iban(std::string_view iban) {
    const std::string s = strip_spaces(iban);
    if (s.size() < kIbanMinLength || s.size() > kIbanMaxLength) return false;
    if (!is_upper_ascii(static_cast<unsigned char>(s[0])) ||
        !is_upper_ascii(static_cast<unsigned char>(s[1]))) return false;
    if (!all_upper_alnum(std::string_view(s).substr(2))) return false;
    return mod97(s) == 1;
}

// RF creditor reference (ISO 11649). No whitespace removal here.
inline bool is_valid_rf_reference(std::string_view ref) {
    if (ref.size() < kRfMinLength || ref.size() > kRfMaxLength) return false;
    if (ref.substr(0, 2) != "RF") return false;
    if (!all_upper_alnum(ref.substr(2))) return false;
    return mod97(ref) == 1;
}

// Creates "RFxx<body>" for a creditor reference body of up to 21 characters.
inline std::optional<std::string> make_rf_reference(std::string_view body) {
    const std::string b = strip_spaces(body);
    if (b.empty() || b.size() > kRfMaxLength - 4) return std::nullopt;
    if (!all_upper_alnum(b)) return std::nullopt;

    // check digits = 98 - (body + "RF00") mod 97; the rearranged form of "RF00<body>"
    const unsigned check = 98u - mod97("RF00" + b);
    std::string out = "RF";
    out.push_back(static_cast<char>('0' + check / 10));
    out.push_back(static_cast<char>('0' + check % 10));
    out += b;
    return out;
}

// Paper format: "DE90 8306 5408 ..."; display only
inline std::string format_iban_groups(std::string_view iban) {
    const std::string s = strip_spaces(iban);
    std::string out;
    out.reserve(s.size() + s.size() / 4);
    for (size_t i = 0; i < s.size(); ++i) {
        if (i > 0 && i % 4 == 0) out.push_back(' ');
        out.push_back(s[i]);
    }
    return out;
}

} // namespace epc
