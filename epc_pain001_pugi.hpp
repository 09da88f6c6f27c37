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
#include "epc_builder.hpp"
#include "epc_amount.hpp"
#include <pugixml.hpp>
#include <istream>
#include <string>
#include <cstring>
#include <cstdlib>

namespace epc {

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) { return std::strcmp(ln(n), wanted) == 0; }

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, const char* wanted) { return std::strcmp(ln(a), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

// depth search (recursive) over all descendants
inline pugi::xml_node desc_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling()) {
        if (isln(c, name)) return c;
        pugi::xml_node found = desc_any(c, name);
        if (found) return found;
    }
    return pugi::xml_node();
}

inline std::string txt(const pugi::xml_node& n) {
    std::string s = n.text().as_string(); // UTF-8
    // trim
    size_t b = 0, e = s.size();
    while (b < e && is_space_ascii(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && is_space_ascii(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}
inline std::string child_text(const pugi::xml_node& p, const char* name) {
    pugi::xml_node n = child_any(p, name);
    return n ? txt(n) : std::string();
}

// "Dt" may be a plain date or wrap <Dt>/<DtTm> (pain.001.001.08+)
inline std::string date_text(const pugi::xml_node& n) {
    if (!n) return {};
    if (pugi::xml_node d = child_any(n, "Dt")) return txt(d);
    if (pugi::xml_node d = child_any(n, "DtTm")) return txt(d);
    return txt(n);
}

inline std::string parse_bic(const pugi::xml_node& agent) {
    pugi::xml_node fi = child_any(agent, "FinInstnId");
    if (!fi) return {};
    std::string bic = child_text(fi, "BIC");
    if (bic.empty()) bic = child_text(fi, "BICFI");
    return bic;
}

inline std::string parse_iban(const pugi::xml_node& acct) {
    pugi::xml_node id = child_any(acct, "Id");
    pugi::xml_node ib = id ? child_any(id, "IBAN") : pugi::xml_node();
    return ib ? strip_spaces(txt(ib)) : std::string();
}

inline std::string parse_local_instrument(const pugi::xml_node& pmtTpInf) {
    pugi::xml_node li = child_any(pmtTpInf, "LclInstrm");
    if (!li) return {};
    std::string cd = child_text(li, "Cd");
    return cd.empty() ? child_text(li, "Prtry") : cd;
}

inline void parse_remittance(const pugi::xml_node& rmt, CreditTransfer& out) {
    for (pugi::xml_node u = rmt.first_child(); u; u = u.next_sibling()) {
        if (isln(u, "Ustrd")) {
            std::string s = txt(u);
            if (!s.empty()) out.unstructured.push_back(s);
        } else if (isln(u, "Strd") && out.creditorReference.empty()) {
            pugi::xml_node cri = desc_any(u, "CdtrRefInf");
            if (cri) out.creditorReference = child_text(cri, "Ref");
        }
    }
}

inline CreditTransfer parse_credit_transfer(const pugi::xml_node& tx) {
    CreditTransfer t;

    if (pugi::xml_node id = child_any(tx, "PmtId")) {
        t.instructionId = child_text(id, "InstrId");
        t.endToEndId = child_text(id, "EndToEndId");
    }
    if (pugi::xml_node tp = child_any(tx, "PmtTpInf"))
        t.localInstrument = parse_local_instrument(tp);

    if (pugi::xml_node amt = child_any(tx, "Amt")) {
        if (pugi::xml_node ia = child_any(amt, "InstdAmt")) {
            t.amountText = txt(ia);
            CurrencyAmount ca;
            for (pugi::xml_attribute at = ia.first_attribute(); at; at = at.next_attribute())
                if (isln(at, "Ccy")) { ca.currency = at.value(); break; }
            if (decimal_to_minor(t.amountText, ca.minor)) t.amount = ca;
        }
    }

    if (pugi::xml_node ag = child_any(tx, "CdtrAgt")) t.creditorBic = parse_bic(ag);
    if (pugi::xml_node cd = child_any(tx, "Cdtr")) t.creditorName = child_text(cd, "Nm");
    if (pugi::xml_node ca = child_any(tx, "CdtrAcct")) t.creditorIban = parse_iban(ca);
    if (pugi::xml_node pp = child_any(tx, "Purp")) t.purposeCode = child_text(pp, "Cd");
    if (pugi::xml_node rm = child_any(tx, "RmtInf")) parse_remittance(rm, t);
    return t;
}

inline PaymentInstruction parse_payment(const pugi::xml_node& pmt) {
    PaymentInstruction p;
    p.pmtInfId = child_text(pmt, "PmtInfId");
    p.executionDate = date_text(child_any(pmt, "ReqdExctnDt"));
    if (pugi::xml_node tp = child_any(pmt, "PmtTpInf")) {
        if (pugi::xml_node sl = child_any(tp, "SvcLvl")) p.serviceLevel = child_text(sl, "Cd");
        p.localInstrument = parse_local_instrument(tp);
    }
    if (pugi::xml_node d = child_any(pmt, "Dbtr")) p.debtorName = child_text(d, "Nm");
    if (pugi::xml_node da = child_any(pmt, "DbtrAcct")) p.debtorIban = parse_iban(da);

    int ordinal = 0;
    for (pugi::xml_node n = pmt.first_child(); n; n = n.next_sibling()) {
        if (!isln(n, "CdtTrfTxInf")) continue;
        CreditTransfer t = parse_credit_transfer(n);
        t.importOrdinal = ordinal++;
        p.transfers.push_back(std::move(t));
    }
    return p;
}

inline InitiationHeader parse_group_header(const pugi::xml_node& gh) {
    InitiationHeader h;
    h.msgId = child_text(gh, "MsgId");
    h.creationDateTime = child_text(gh, "CreDtTm");
    h.numberOfTransactions = std::atoi(child_text(gh, "NbOfTxs").c_str());
    if (pugi::xml_node ip = child_any(gh, "InitgPty")) h.initiatingParty = child_text(ip, "Nm");
    return h;
}

// Root may be <Document> or the message element itself
inline pugi::xml_node find_initiation(const pugi::xml_node& root) {
    if (isln(root, "CstmrCdtTrfInitn")) return root;
    return child_any(root, "CstmrCdtTrfInitn");
}

inline bool is_instant(const PaymentInstruction& p, const CreditTransfer& t) {
    return t.localInstrument == "INST" || p.localInstrument == "INST";
}

// Maps a credit transfer onto a builder. The builder still validates on build().
inline bool make_builder(const PaymentInstruction& p, const CreditTransfer& t, Version version,
                         Builder& out, std::string* error=nullptr) {
    if (t.amount && t.amount->currency.empty()) {
        if (error) *error = "Missing currency for amount " + t.amountText;
        return false;
    }
    if (t.amount && t.amount->currency != "EUR") {
        if (error) *error = "Unsupported currency " + t.amount->currency;
        return false;
    }
    if (!t.amount && !t.amountText.empty()) {
        if (error) *error = "Unparsable amount " + t.amountText;
        return false;
    }

    out.version(version)
       .character_set(CharacterSet::UTF8)
       .identification(is_instant(p, t) ? Identification::INST : Identification::SCT);

    if (!t.creditorBic.empty()) out.bic(t.creditorBic);
    if (!t.creditorName.empty()) out.beneficiary(t.creditorName);
    if (!t.creditorIban.empty()) out.iban(t.creditorIban);
    if (t.amount) out.amount_minor(t.amount->minor);
    if (t.purposeCode == "BENE") out.purpose(Purpose::bene());
    else if (!t.purposeCode.empty()) out.purpose(Purpose::custom(t.purposeCode));

    if (!t.creditorReference.empty()) {
        out.remittance(Remittance::reference(t.creditorReference));
    } else if (!t.unstructured.empty()) {
        std::string text;
        for (const auto& u : t.unstructured) {
            if (!text.empty()) text += ' ';
            text += u;
        }
        out.remittance(Remittance::text(text));
    }

    if (!t.endToEndId.empty() && t.endToEndId != "NOTPROVIDED") out.information(t.endToEndId);
    return true;
}

// ---------- Reader-Class ----------
class Pain001Reader {
public:

    bool parse_file(const std::string& path, InitiationDocument& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error="XML file parse error"; return false; }
        return parse_doc(doc, out, error);
    }

    bool parse_file(std::istream& is, InitiationDocument& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load(is, pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error="XML file parse error"; return false; }
        return parse_doc(doc, out, error);
    }

    bool parse_string(const std::string& xml_utf8, InitiationDocument& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_buffer(xml_utf8.data(), xml_utf8.size(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error="XML parse error"; return false; }
        return parse_doc(doc, out, error);
    }

private:
    bool parse_doc(const pugi::xml_document& doc, InitiationDocument& out, std::string* error) const {
        pugi::xml_node root = doc.document_element();
        if (!root){ if(error)*error="Empty document"; return false; }
        pugi::xml_node init = find_initiation(root);
        if (!init){ if(error)*error="Unsupported pain.001 root"; return false; }

        if (pugi::xml_node g = child_any(init, "GrpHdr"))
            out.header = parse_group_header(g);

        for (pugi::xml_node n = init.first_child(); n; n = n.next_sibling()) {
            if (isln(n, "PmtInf"))
                out.payments.push_back(parse_payment(n));
        }
        return true;
    }
};

} // namespace epc
