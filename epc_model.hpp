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
#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <utility>

namespace epc {

class Builder;

// --- Limits ---
constexpr std::size_t kIbanMinLength = 5;
constexpr std::size_t kIbanMaxLength = 34;
constexpr std::size_t kRfMinLength = 5;
constexpr std::size_t kRfMaxLength = 25;
constexpr std::size_t kRemittanceTextMaxLength = 140;
constexpr std::size_t kAmountMaxIntegerDigits = 9;
constexpr std::size_t kPurposeCodeLength = 4;
constexpr std::int64_t kAmountMinMinor = 1;              // 0.01
constexpr std::int64_t kAmountMaxMinor = 99999999999;    // 999999999.99

// --- Codes ---
enum class ServiceTag { BCD };

enum class Version {
    V1,  // 001 - EEA plus non-EEA, BIC mandatory
    V2   // 002 - EEA only, BIC optional
};

// Only UTF-8 for now; 2..8 are reserved for ISO-8859-1/2/4/5/7/10/15
enum class CharacterSet { UTF8 };

enum class Identification {
    SCT,  // SEPA Credit Transfer
    INST  // SEPA Instant Credit Transfer
};

inline const char* to_code(ServiceTag) noexcept { return "BCD"; }

inline const char* to_code(Version v) noexcept {
    return v == Version::V1 ? "001" : "002";
}

inline const char* to_code(CharacterSet) noexcept { return "1"; }

inline const char* to_code(Identification i) noexcept {
    return i == Identification::SCT ? "SCT" : "INST";
}

// Verwendungszweck-Code (AT-44)
struct Purpose {
    enum class Kind { Bene, Custom };

    Kind kind{Kind::Bene};
    std::string code;   // only used for Kind::Custom

    static Purpose bene() { return Purpose{}; }
    static Purpose custom(std::string c) {
        Purpose p;
        p.kind = Kind::Custom;
        p.code = std::move(c);
        return p;
    }

    std::string to_code() const { return kind == Kind::Bene ? std::string("BENE") : code; }

    bool operator==(const Purpose& o) const { return kind == o.kind && code == o.code; }
    bool operator!=(const Purpose& o) const { return !(*this == o); }
};

// Payload fields are line based; CR and LF inside a value become a space.
inline std::string single_line(std::string s) {
    for (char& c : s)
        if (c == '\r' || c == '\n') c = ' ';
    return s;
}

// Remittance information: either structured (RF creditor reference) or free text.
// Exactly one of both lines is filled in the payload.
struct Remittance {
    enum class Kind { Reference, Text };

    Kind kind{Kind::Text};
    std::string value;

    static Remittance reference(std::string r) {
        Remittance x;
        x.kind = Kind::Reference;
        x.value = std::move(r);
        return x;
    }
    static Remittance text(std::string t) {
        Remittance x;
        x.kind = Kind::Text;
        x.value = single_line(std::move(t));
        return x;
    }

    bool is_reference() const { return kind == Kind::Reference; }
    bool is_text() const { return kind == Kind::Text; }

    bool operator==(const Remittance& o) const { return kind == o.kind && value == o.value; }
    bool operator!=(const Remittance& o) const { return !(*this == o); }
};

// One kind per validation rule, reported in this order by Builder::build()
enum class BuildError {
    None,
    MissingVersion,
    MissingCharacterSet,
    MissingIdentification,
    BicRequiredForVersion,
    MissingBeneficiary,
    MissingIban,
    InvalidIban,
    InvalidAmount,
    InvalidPurpose,
    InvalidRemittanceReference,
    RemittanceTextTooLong
};

inline const char* to_string(BuildError e) noexcept {
    switch (e) {
    case BuildError::None:                       return "None";
    case BuildError::MissingVersion:             return "MissingVersion";
    case BuildError::MissingCharacterSet:        return "MissingCharacterSet";
    case BuildError::MissingIdentification:      return "MissingIdentification";
    case BuildError::BicRequiredForVersion:      return "BicRequiredForVersion";
    case BuildError::MissingBeneficiary:         return "MissingBeneficiary";
    case BuildError::MissingIban:                return "MissingIban";
    case BuildError::InvalidIban:                return "InvalidIban";
    case BuildError::InvalidAmount:              return "InvalidAmount";
    case BuildError::InvalidPurpose:             return "InvalidPurpose";
    case BuildError::InvalidRemittanceReference: return "InvalidRemittanceReference";
    case BuildError::RemittanceTextTooLong:      return "RemittanceTextTooLong";
    }
    return "Unknown";
}

inline const char* describe(BuildError e) noexcept {
    switch (e) {
    case BuildError::None:                       return "no error";
    case BuildError::MissingVersion:             return "version missing";
    case BuildError::MissingCharacterSet:        return "character set missing";
    case BuildError::MissingIdentification:      return "identification missing";
    case BuildError::BicRequiredForVersion:      return "BIC is missing but version is not 002";
    case BuildError::MissingBeneficiary:         return "beneficiary missing";
    case BuildError::MissingIban:                return "IBAN missing";
    case BuildError::InvalidIban:                return "invalid IBAN";
    case BuildError::InvalidAmount:              return "invalid amount (0.01 - 999999999.99, two decimals)";
    case BuildError::InvalidPurpose:             return "invalid purpose (4 uppercase letters)";
    case BuildError::InvalidRemittanceReference: return "invalid RF creditor reference";
    case BuildError::RemittanceTextTooLong:      return "remittance text exceeds 140 characters";
    }
    return "unknown error";
}

// Validated EPC payload. Only Builder::build() creates instances.
class Payload {
public:
    ServiceTag service_tag() const { return m_serviceTag; }
    Version version() const { return m_version; }
    CharacterSet character_set() const { return m_characterSet; }
    Identification identification() const { return m_identification; }
    const std::optional<std::string>& bic() const { return m_bic; }
    const std::string& beneficiary() const { return m_beneficiary; }
    const std::string& iban() const { return m_iban; }          // compact, no spaces
    const std::optional<std::string>& amount() const { return m_amount; }   // "123.45"
    const std::optional<Purpose>& purpose() const { return m_purpose; }
    const std::optional<Remittance>& remittance() const { return m_remittance; }
    const std::optional<std::string>& information() const { return m_information; }

    bool operator==(const Payload& o) const {
        return m_serviceTag == o.m_serviceTag && m_version == o.m_version &&
               m_characterSet == o.m_characterSet && m_identification == o.m_identification &&
               m_bic == o.m_bic && m_beneficiary == o.m_beneficiary && m_iban == o.m_iban &&
               m_amount == o.m_amount && m_purpose == o.m_purpose &&
               m_remittance == o.m_remittance && m_information == o.m_information;
    }
    bool operator!=(const Payload& o) const { return !(*this == o); }

private:
    friend class Builder;
    Payload() = default;

    ServiceTag m_serviceTag{ServiceTag::BCD};
    Version m_version{Version::V2};
    CharacterSet m_characterSet{CharacterSet::UTF8};
    Identification m_identification{Identification::SCT};
    std::optional<std::string> m_bic;
    std::string m_beneficiary;
    std::string m_iban;
    std::optional<std::string> m_amount;
    std::optional<Purpose> m_purpose;
    std::optional<Remittance> m_remittance;
    std::optional<std::string> m_information;
};

} // namespace epc
