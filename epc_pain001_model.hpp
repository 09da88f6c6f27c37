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
#include <vector>
#include <cstdint>
#include <optional>

namespace epc {

// --- Basis ---
struct CurrencyAmount {
    std::string currency;     // "EUR"
    std::int64_t minor{0};    // Minor units (Cent e.g.)
};

// Einzelueberweisung (PmtInf->CdtTrfTxInf)
struct CreditTransfer {
    std::string instructionId;    // PmtId/InstrId
    std::string endToEndId;       // PmtId/EndToEndId
    std::string localInstrument;  // PmtTpInf/LclInstrm/Cd (transaction level)
    std::optional<CurrencyAmount> amount; // Amt/InstdAmt
    std::string amountText;       // raw InstdAmt text, kept for diagnostics
    std::string creditorName;     // Cdtr/Nm
    std::string creditorIban;     // CdtrAcct/Id/IBAN
    std::string creditorBic;      // CdtrAgt/FinInstnId/BIC or BICFI
    std::string purposeCode;      // Purp/Cd
    std::vector<std::string> unstructured; // RmtInf/Ustrd[]
    std::string creditorReference;         // RmtInf/Strd/CdtrRefInf/Ref
    int importOrdinal{-1};        // order inside the PmtInf
};

// Zahlungsinformation (PmtInf)
struct PaymentInstruction {
    std::string pmtInfId;         // PmtInfId
    std::string executionDate;    // ReqdExctnDt or ReqdExctnDt/Dt | ISO
    std::string serviceLevel;     // PmtTpInf/SvcLvl/Cd, "SEPA"
    std::string localInstrument;  // PmtTpInf/LclInstrm/Cd, "INST" for instant
    std::string debtorName;       // Dbtr/Nm
    std::string debtorIban;       // DbtrAcct/Id/IBAN
    std::vector<CreditTransfer> transfers;
};

struct InitiationHeader {
    std::string msgId;            // GrpHdr/MsgId
    std::string creationDateTime; // GrpHdr/CreDtTm
    std::string initiatingParty;  // GrpHdr/InitgPty/Nm
    int numberOfTransactions{0};  // GrpHdr/NbOfTxs
};

struct InitiationDocument {
    InitiationHeader header;
    std::vector<PaymentInstruction> payments;
};

} // namespace epc
