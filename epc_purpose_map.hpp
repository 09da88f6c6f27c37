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
#include <string_view>
#include <vector>
#include <sstream>
#include <algorithm>
#include <map>
#include <cctype>

namespace epc {

// ----------------------------- Embedded CSV -----------------------------
// Excerpt of ISO 20022 ExternalPurpose1Code (the codes banking apps offer).
// Format:
// Code;Description
inline constexpr const char* kPurposeCsvEmbedded = R"(Code;Description
ACCT;Account Management
ALMY;Alimony Payment
BECH;Child Benefit
BENE;Unemployment Disability Benefit
BONU;Bonus Payment
CASH;Cash Management Transfer
CBFF;Capital Building
CHAR;Charity Payment
COLL;Collection Payment
COMC;Commercial Payment
COMM;Commission
DIVD;Dividend
ELEC;Electricity Bill
GASB;Gas Bill
GDDS;Purchase Sale Of Goods
GOVT;Government Payment
HLTI;Health Insurance
INSU;Insurance Premium
INTC;Intra Company Payment
INTE;Interest
LIFI;Life Insurance
LOAN;Loan
OTHR;Other
PENS;Pension Payment
PHON;Telephone Bill
RENT;Rent
SALA;Salary Payment
SCVE;Purchase Sale Of Services
SSBE;Social Security Benefit
SUPP;Supplier Payment
TAXS;Tax Payment
TREA;Treasury Payment
VATX;Value Added Tax Payment
WTER;Water Bill
)";

inline std::string trim_copy(std::string_view sv) {
    auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t b = 0, e = sv.size();
    while (b < e && is_space(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(sv[e-1]))) --e;
    return std::string(sv.substr(b, e - b));
}

inline std::string upper_trim(std::string_view s) {
    std::string r = trim_copy(s);
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
    return r;
}

inline std::vector<std::string> split_semicolon(std::string_view line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= line.size()) {
        size_t pos = line.find(';', start);
        if (pos == std::string_view::npos) {
            out.emplace_back(trim_copy(line.substr(start)));
            break;
        }
        out.emplace_back(trim_copy(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

// Key = "SALA", Val = "Salary Payment"
using PurposeMap = std::map<std::string, std::string>;

// Builds the map from the embedded CSV.
inline PurposeMap build_purpose_map_from_embedded() {
    PurposeMap map;
    std::istringstream iss(std::string{kPurposeCsvEmbedded});
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 2) continue;
        if (cols[0] == "Code") continue; // Header

        const std::string code = upper_trim(cols[0]);
        if (code.size() != 4 || cols[1].empty()) continue;
        map.emplace(code, cols[1]);
    }
    return map;
}

// Singleton access (build once, then reuse)
inline const PurposeMap& get_purpose_map() {
    static const PurposeMap M = build_purpose_map_from_embedded();
    return M;
}

inline std::string describe_purpose(std::string_view code) {
    const PurposeMap& m = get_purpose_map();
    if (auto it = m.find(upper_trim(code)); it != m.end()) return it->second;
    return {};
}

inline bool is_known_purpose(std::string_view code) {
    return get_purpose_map().count(upper_trim(code)) != 0;
}

} // namespace epc
