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
#include "epc_builder.hpp"
#include "epc_amount.hpp"
#include "epc_format.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace epc {

// splits on '\n', drops one trailing '\r' per line
inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        std::string_view line = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        out.push_back(line);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return out;
}

// ---------- Parser-Class (scanner side) ----------
class PayloadParser {
public:

    std::optional<Payload> parse_string(std::string_view text, std::string* error=nullptr) const {
        std::vector<std::string_view> lines = split_lines(text);
        if (lines.size() < to_index(PayloadLine::RemittanceReference) + 1)
            return fail(error, "Too few lines");
        if (lines.size() > kPayloadLineCount)
            return fail(error, "Too many lines");
        lines.resize(kPayloadLineCount);

        auto line = [&lines](PayloadLine l) { return lines[to_index(l)]; };

        if (line(PayloadLine::ServiceTag) != "BCD")
            return fail(error, "Line 1: unknown service tag");

        Builder b;

        std::string_view v = line(PayloadLine::Version);
        if (v == "001") b.version(Version::V1);
        else if (v == "002") b.version(Version::V2);
        else return fail(error, "Line 2: unknown version");

        if (line(PayloadLine::CharacterSet) != "1")
            return fail(error, "Line 3: unsupported character set");
        b.character_set(CharacterSet::UTF8);

        std::string_view id = line(PayloadLine::Identification);
        if (id == "SCT") b.identification(Identification::SCT);
        else if (id == "INST") b.identification(Identification::INST);
        else return fail(error, "Line 4: unknown identification");

        if (!line(PayloadLine::Bic).empty()) b.bic(std::string(line(PayloadLine::Bic)));
        if (!line(PayloadLine::Beneficiary).empty()) b.beneficiary(std::string(line(PayloadLine::Beneficiary)));
        if (!line(PayloadLine::Iban).empty()) b.iban(line(PayloadLine::Iban));

        std::string_view amt = line(PayloadLine::Amount);
        if (!amt.empty()) {
            if (amt.substr(0, 3) == "EUR") amt.remove_prefix(3);
            std::int64_t minor = 0;
            if (!decimal_to_minor(amt, minor))
                return fail(error, "Line 8: malformed amount");
            b.amount_minor(minor);
        }

        std::string_view purp = line(PayloadLine::Purpose);
        if (purp == "BENE") b.purpose(Purpose::bene());
        else if (!purp.empty()) b.purpose(Purpose::custom(std::string(purp)));

        std::string_view ref = line(PayloadLine::RemittanceReference);
        std::string_view txt = line(PayloadLine::RemittanceText);
        if (!ref.empty() && !txt.empty())
            return fail(error, "Lines 10/11: structured and unstructured remittance both set");
        if (!ref.empty()) b.remittance(Remittance::reference(std::string(ref)));
        else if (!txt.empty()) b.remittance(Remittance::text(std::string(txt)));

        if (!line(PayloadLine::Information).empty())
            b.information(std::string(line(PayloadLine::Information)));

        BuildError err = BuildError::None;
        std::optional<Payload> p = b.build(&err);
        if (!p) return fail(error, to_string(err));
        return p;
    }

private:
    static std::optional<Payload> fail(std::string* error, const char* msg) {
        if (error) *error = msg;
        return std::nullopt;
    }
};

} // namespace epc
