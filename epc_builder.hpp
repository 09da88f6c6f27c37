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
#include "epc_amount.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace epc {

// code points, not bytes
inline size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80) ++n;
    return n;
}

inline bool is_valid_purpose(const Purpose& p) {
    if (p.kind == Purpose::Kind::Bene) return true;
    if (p.code.size() != kPurposeCodeLength) return false;
    for (unsigned char c : p.code)
        if (!is_upper_ascii(c)) return false;
    return true;
}

// Collects the fields in any order; build() validates everything in one pass.
// Setting a field twice keeps the latest value. The builder stays usable after
// a failed build().
class Builder {
public:
    Builder& version(Version v) { m_version = v; return *this; }
    Builder& character_set(CharacterSet cs) { m_characterSet = cs; return *this; }
    Builder& identification(Identification id) { m_identification = id; return *this; }
    Builder& bic(std::string bic) { m_bic = single_line(std::move(bic)); return *this; }
    Builder& beneficiary(std::string name) { m_beneficiary = single_line(std::move(name)); return *this; }

    // stored without any whitespace
    Builder& iban(std::string_view iban) { m_iban = strip_spaces(iban); return *this; }

    // kept as given, e.g. "10.00"
    Builder& amount(std::string amount) { m_amount = std::move(amount); return *this; }

    // euro cents; an out-of-range value makes build() fail with InvalidAmount
    Builder& amount_minor(std::int64_t minor) {
        if (auto s = amount_from_minor(minor)) m_amount = *s;
        else m_amount = std::to_string(minor);
        return *this;
    }

    Builder& purpose(Purpose p) { m_purpose = std::move(p); return *this; }
    Builder& remittance(Remittance r) {
        if (r.is_text()) r.value = single_line(std::move(r.value));
        m_remittance = std::move(r);
        return *this;
    }
    Builder& information(std::string info) { m_information = single_line(std::move(info)); return *this; }

    std::optional<Payload> build(BuildError* error = nullptr) const {
        BuildError err = validate();
        if (error) *error = err;
        if (err != BuildError::None) return std::nullopt;

        Payload p;
        p.m_version = *m_version;
        p.m_characterSet = *m_characterSet;
        p.m_identification = *m_identification;
        if (m_bic && !m_bic->empty()) p.m_bic = m_bic;
        p.m_beneficiary = *m_beneficiary;
        p.m_iban = *m_iban;
        p.m_amount = m_amount;
        p.m_purpose = m_purpose;
        if (m_remittance && !m_remittance->value.empty()) p.m_remittance = m_remittance;
        p.m_information = m_information;
        return p;
    }

private:
    // first violated rule wins
    BuildError validate() const {
        if (!m_version) return BuildError::MissingVersion;
        if (!m_characterSet) return BuildError::MissingCharacterSet;
        if (!m_identification) return BuildError::MissingIdentification;
        if ((!m_bic || m_bic->empty()) && *m_version != Version::V2)
            return BuildError::BicRequiredForVersion;
        if (!m_beneficiary || m_beneficiary->empty()) return BuildError::MissingBeneficiary;
        if (!m_iban || m_iban->empty()) return BuildError::MissingIban;
        if (!is_valid_iban(*m_iban)) return BuildError::InvalidIban;
        if (m_amount && !is_valid_amount(*m_amount)) return BuildError::InvalidAmount;
        if (m_purpose && !is_valid_purpose(*m_purpose)) return BuildError::InvalidPurpose;
        if (m_remittance) {
            if (m_remittance->is_reference()) {
                if (!is_valid_rf_reference(m_remittance->value))
                    return BuildError::InvalidRemittanceReference;
            } else if (utf8_length(m_remittance->value) > kRemittanceTextMaxLength) {
                return BuildError::RemittanceTextTooLong;
            }
        }
        return BuildError::None;
    }

    std::optional<Version> m_version;
    std::optional<CharacterSet> m_characterSet;
    std::optional<Identification> m_identification;
    std::optional<std::string> m_bic;
    std::optional<std::string> m_beneficiary;
    std::optional<std::string> m_iban;
    std::optional<std::string> m_amount;
    std::optional<Purpose> m_purpose;
    std::optional<Remittance> m_remittance;
    std::optional<std::string> m_information;
};

} // namespace epc
