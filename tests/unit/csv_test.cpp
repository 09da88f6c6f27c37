/**
 * epc qr payload - version 1.00
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 * @brief CSV batch export tests
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "epc_csv.hpp"

using namespace epc;

static const char* kPain001 = R"(<Document xmlns="urn:iso:std:iso:20022:tech:xsd:pain.001.001.03">
  <CstmrCdtTrfInitn>
    <GrpHdr><MsgId>M1</MsgId><NbOfTxs>3</NbOfTxs></GrpHdr>
    <PmtInf>
      <PmtInfId>P1</PmtInfId>
      <CdtTrfTxInf>
        <PmtId><EndToEndId>E1</EndToEndId></PmtId>
        <Amt><InstdAmt Ccy="EUR">10.00</InstdAmt></Amt>
        <Cdtr><Nm>Codeberg e.V.</Nm></Cdtr>
        <CdtrAcct><Id><IBAN>DE90830654080004104242</IBAN></Id></CdtrAcct>
        <Purp><Cd>CHAR</Cd></Purp>
        <RmtInf><Ustrd>Spende; danke</Ustrd></RmtInf>
      </CdtTrfTxInf>
      <CdtTrfTxInf>
        <PmtId><EndToEndId>E2</EndToEndId></PmtId>
        <Amt><InstdAmt Ccy="EUR">5.00</InstdAmt></Amt>
        <Cdtr><Nm>Broken</Nm></Cdtr>
        <CdtrAcct><Id><IBAN>DE90830654080004104243</IBAN></Id></CdtrAcct>
      </CdtTrfTxInf>
      <CdtTrfTxInf>
        <PmtId><EndToEndId>E3</EndToEndId></PmtId>
        <Amt><InstdAmt Ccy="USD">5.00</InstdAmt></Amt>
        <Cdtr><Nm>Dollar</Nm></Cdtr>
        <CdtrAcct><Id><IBAN>AT611904300234573201</IBAN></Id></CdtrAcct>
      </CdtTrfTxInf>
    </PmtInf>
  </CstmrCdtTrfInitn>
</Document>)";

class CsvExportTest : public ::testing::Test {
protected:
    InitiationDocument doc;

    void SetUp() override {
        Pain001Reader reader;
        std::string err;
        ASSERT_TRUE(reader.parse_string(kPain001, doc, &err)) << err;
    }

    const std::string& cell(const PayloadRow& row, ExportField f) const {
        return row[to_index(f)];
    }
};

TEST_F(CsvExportTest, OneRowPerTransferPlusHeader) {
    ExportData rows;
    export_payloads_csv(doc, nullptr, &rows);
    ASSERT_EQ(4u, rows.size());
    EXPECT_EQ("PaymentInfoId", rows[0][0]);
    EXPECT_EQ("Payload", rows[0][to_index(ExportField::Payload)]);
    for (const auto& r : rows)
        EXPECT_EQ(to_index(ExportField::Count), r.size());
}

TEST_F(CsvExportTest, StatusPerTransfer) {
    ExportData rows;
    export_payloads_csv(doc, nullptr, &rows);
    ASSERT_EQ(4u, rows.size());

    EXPECT_EQ("OK", cell(rows[1], ExportField::Status));
    EXPECT_EQ("P1", cell(rows[1], ExportField::PaymentInfoId));
    EXPECT_EQ("10.00", cell(rows[1], ExportField::Amount));
    EXPECT_EQ("Charity Payment", cell(rows[1], ExportField::PurposeDescription));
    EXPECT_EQ("BCD\\n002\\n1\\nSCT\\n\\nCodeberg e.V.\\nDE90830654080004104242\\n10.00\\nCHAR\\n\\nSpende; danke\\nE1",
              cell(rows[1], ExportField::Payload));

    EXPECT_EQ("InvalidIban", cell(rows[2], ExportField::Status));
    EXPECT_EQ("", cell(rows[2], ExportField::Payload));

    EXPECT_EQ("Unsupported currency USD", cell(rows[3], ExportField::Status));
}

TEST_F(CsvExportTest, WritesEscapedCsv) {
    std::ostringstream os;
    ExportOptions opt;
    opt.include_header = false;
    export_payloads_csv(doc, &os, nullptr, opt);

    std::string first = os.str().substr(0, os.str().find('\n'));
    // payload contains the delimiter, so it is quoted
    EXPECT_EQ("P1;E1;Codeberg e.V.;DE90830654080004104242;;10.00;CHAR;Charity Payment;OK;"
              "\"BCD\\n002\\n1\\nSCT\\n\\nCodeberg e.V.\\nDE90830654080004104242\\n10.00\\nCHAR\\n\\nSpende; danke\\nE1\"",
              first);
}

TEST_F(CsvExportTest, Utf8BomAndVerbatimPayload) {
    std::ostringstream os;
    ExportOptions opt;
    opt.write_utf8_bom = true;
    opt.escape_payload_newlines = false;
    opt.version = Version::V1;
    ExportData rows;
    export_payloads_csv(doc, &os, &rows, opt);

    const std::string out = os.str();
    ASSERT_GE(out.size(), 3u);
    EXPECT_EQ("\xEF\xBB\xBF", out.substr(0, 3));
    // version 001 without BIC in the source document
    EXPECT_EQ("BicRequiredForVersion", cell(rows[1], ExportField::Status));
}

TEST(CsvEscapeTest, QuotesWhenNeeded) {
    EXPECT_EQ("plain", csv_escape("plain", ';'));
    EXPECT_EQ("\"a;b\"", csv_escape("a;b", ';'));
    EXPECT_EQ("\"say \"\"hi\"\"\"", csv_escape("say \"hi\"", ';'));
    EXPECT_EQ("\"line\nbreak\"", csv_escape("line\nbreak", ';'));
    EXPECT_EQ("a;b", csv_escape("a;b", ','));
}
