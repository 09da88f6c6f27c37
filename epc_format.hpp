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
#include <ostream>
#include <sstream>
#include <string>
#include <cstddef>

namespace epc {

// Fixed line positions of the payload (0-based)
enum class PayloadLine {
    ServiceTag,
    Version,
    CharacterSet,
    Identification,
    Bic,
    Beneficiary,
    Iban,
    Amount,
    Purpose,
    RemittanceReference,
    RemittanceText,
    Information,
    Count // number of lines
};

constexpr std::size_t to_index(PayloadLine l) noexcept {
    return static_cast<std::size_t>(l);
}

constexpr std::size_t kPayloadLineCount = to_index(PayloadLine::Count);

// Lines separated by '\n', absent optional fields as empty lines,
// no separator after the last line.
inline void write_payload(const Payload& p, std::ostream& os) {
    const std::string empty;
    os << to_code(p.service_tag()) << '\n'
       << to_code(p.version()) << '\n'
       << to_code(p.character_set()) << '\n'
       << to_code(p.identification()) << '\n'
       << p.bic().value_or(empty) << '\n'
       << p.beneficiary() << '\n'
       << p.iban() << '\n'
       << p.amount().value_or(empty) << '\n';

    if (p.purpose()) os << p.purpose()->to_code();
    os << '\n';

    const auto& r = p.remittance();
    if (r && r->is_reference()) os << r->value;
    os << '\n';
    if (r && r->is_text()) os << r->value;
    os << '\n';

    os << p.information().value_or(empty);
}

inline std::string to_string(const Payload& p) {
    std::ostringstream oss;
    write_payload(p, oss);
    return oss.str();
}

inline std::ostream& operator<<(std::ostream& os, const Payload& p) {
    write_payload(p, os);
    return os;
}

} // namespace epc
