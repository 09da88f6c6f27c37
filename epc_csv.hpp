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
#include "epc_pain001_model.hpp"
#include "epc_pain001_pugi.hpp"
#include "epc_builder.hpp"
#include "epc_format.hpp"
#include "epc_purpose_map.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace epc {

struct ExportOptions {
    char delimiter = ';';
    bool include_header = true;
    bool write_utf8_bom = false;   // Excel-compatible

    // true  => payload line breaks written as the two characters "\n" (one CSV line per row)
    // false => payload kept verbatim inside a quoted field
    bool escape_payload_newlines = true;

    Version version = Version::V2;
};

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

inline std::string escape_newlines(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 16);
    for (char c : s) {
        if (c == '\n') out += "\\n";
        else out.push_back(c);
    }
    return out;
}

using PayloadRow = std::vector<std::string>;
using ExportData = std::vector<PayloadRow>;

enum class ExportField {
    PaymentInfoId,
    EndToEndId,
    Beneficiary,
    IBAN,
    BIC,
    Amount,
    PurposeCode,
    PurposeDescription,
    Status,
    Payload,
    Count // Array size
};

constexpr std::size_t to_index(ExportField f) noexcept {
    return static_cast<std::size_t>(f);
}

inline const char* field_name(ExportField f) noexcept {
    switch (f) {
    case ExportField::PaymentInfoId:      return "PaymentInfoId";
    case ExportField::EndToEndId:         return "EndToEndId";
    case ExportField::Beneficiary:        return "Beneficiary";
    case ExportField::IBAN:               return "IBAN";
    case ExportField::BIC:                return "BIC";
    case ExportField::Amount:             return "Amount";
    case ExportField::PurposeCode:        return "PurposeCode";
    case ExportField::PurposeDescription: return "PurposeDescription";
    case ExportField::Status:             return "Status";
    case ExportField::Payload:            return "Payload";
    case ExportField::Count:              break;
    }
    return "";
}

// One row per credit transfer; Status is "OK" or the reason the payload could not be built.
inline PayloadRow make_row(const PaymentInstruction& p, const CreditTransfer& t, const ExportOptions& opt) {
    PayloadRow row(to_index(ExportField::Count));
    auto set = [&row](ExportField f, std::string v) { row[to_index(f)] = std::move(v); };

    set(ExportField::PaymentInfoId, p.pmtInfId);
    set(ExportField::EndToEndId, t.endToEndId);
    set(ExportField::Beneficiary, t.creditorName);
    set(ExportField::IBAN, t.creditorIban);
    set(ExportField::BIC, t.creditorBic);
    set(ExportField::PurposeCode, t.purposeCode);
    set(ExportField::PurposeDescription, describe_purpose(t.purposeCode));
    if (t.amount) {
        if (auto a = amount_from_minor(t.amount->minor)) set(ExportField::Amount, *a);
        else set(ExportField::Amount, t.amountText);
    } else {
        set(ExportField::Amount, t.amountText);
    }

    Builder b;
    std::string err;
    if (!make_builder(p, t, opt.version, b, &err)) {
        set(ExportField::Status, err);
        return row;
    }
    BuildError be = BuildError::None;
    std::optional<Payload> payload = b.build(&be);
    if (!payload) {
        set(ExportField::Status, to_string(be));
        return row;
    }
    set(ExportField::Status, "OK");
    std::string text = to_string(*payload);
    set(ExportField::Payload, opt.escape_payload_newlines ? escape_newlines(text) : text);
    return row;
}

// === Actual export function ===========================================
inline void export_payloads_csv(const InitiationDocument& doc, std::ostream* osPtr=nullptr,
                                ExportData* vPtr=nullptr, const ExportOptions& opt = {}) {
    if (osPtr && opt.write_utf8_bom) {
        const unsigned char bom[3] = {0xEF,0xBB,0xBF};
        osPtr->write(reinterpret_cast<const char*>(bom), 3);
    }
    const char D = opt.delimiter;

    auto emit = [&](const PayloadRow& row) {
        if (osPtr) {
            for (size_t i = 0; i < row.size(); ++i) {
                if (i) *osPtr << D;
                *osPtr << csv_escape(row[i], D);
            }
            *osPtr << "\n";
        }
        if (vPtr) vPtr->push_back(row);
    };

    if (opt.include_header) {
        PayloadRow header;
        for (size_t i = 0; i < to_index(ExportField::Count); ++i)
            header.push_back(field_name(static_cast<ExportField>(i)));
        emit(header);
    }

    for (const auto& p : doc.payments)
        for (const auto& t : p.transfers)
            emit(make_row(p, t, opt));
}

} // namespace epc
