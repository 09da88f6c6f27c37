#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <epc_builder.hpp>
#include <epc_format.hpp>
#include <epc_checksum.hpp>
#include <epc_purpose_map.hpp>
#include <epc_pain001_pugi.hpp>
#include <epc_csv.hpp>

Q_LOGGING_CATEGORY(lcDemo, "epc.demo")

// Largest payload a banking app has to accept (version 002, byte mode)
static constexpr int kMaxPayloadBytes = 331;

static std::string S(const QString& s) { return s.toUtf8().toStdString(); }

static int run_single(const QCommandLineParser& cli)
{
    epc::Builder b;
    b.version(cli.value("version") == "1" ? epc::Version::V1 : epc::Version::V2)
     .character_set(epc::CharacterSet::UTF8)
     .identification(cli.isSet("instant") ? epc::Identification::INST : epc::Identification::SCT);

    if (cli.isSet("bic"))         b.bic(S(cli.value("bic")));
    if (cli.isSet("name"))        b.beneficiary(S(cli.value("name")));
    if (cli.isSet("iban"))        b.iban(S(cli.value("iban")));
    if (cli.isSet("info"))        b.information(S(cli.value("info")));

    if (cli.isSet("amount")) {
        std::int64_t minor = 0;
        if (!epc::decimal_to_minor(S(cli.value("amount")), minor)) {
            qCCritical(lcDemo, "Malformed amount: %s", qPrintable(cli.value("amount")));
            return 1;
        }
        b.amount_minor(minor);
    }

    if (cli.isSet("purpose")) {
        const std::string code = S(cli.value("purpose"));
        if (code == "BENE") b.purpose(epc::Purpose::bene());
        else b.purpose(epc::Purpose::custom(code));
        const std::string desc = epc::describe_purpose(code);
        if (desc.empty()) qCWarning(lcDemo, "Purpose %s is not in the catalog", code.c_str());
        else qCDebug(lcDemo, "Purpose %s: %s", code.c_str(), desc.c_str());
    }

    if (cli.isSet("reference") && cli.isSet("text")) {
        qCCritical(lcDemo, "--reference and --text are mutually exclusive");
        return 1;
    }
    if (cli.isSet("reference")) {
        std::string ref = S(cli.value("reference"));
        // a bare creditor reference body gets its RF check digits here
        if (ref.compare(0, 2, "RF") != 0) {
            if (auto rf = epc::make_rf_reference(ref)) {
                qCInfo(lcDemo, "Generated RF reference %s", rf->c_str());
                ref = *rf;
            }
        }
        b.remittance(epc::Remittance::reference(ref));
    }
    if (cli.isSet("text")) b.remittance(epc::Remittance::text(S(cli.value("text"))));

    epc::BuildError err = epc::BuildError::None;
    std::optional<epc::Payload> payload = b.build(&err);
    if (!payload) {
        qCCritical(lcDemo, "Cannot build payload: %s (%s)", epc::to_string(err), epc::describe(err));
        return 1;
    }

    const std::string text = epc::to_string(*payload);
    qCInfo(lcDemo, "Beneficiary IBAN %s", epc::format_iban_groups(payload->iban()).c_str());
    if (static_cast<int>(text.size()) > kMaxPayloadBytes)
        qCWarning(lcDemo, "Payload has %d bytes, more than %d", static_cast<int>(text.size()), kMaxPayloadBytes);

    std::cout << text << std::endl;
    return 0;
}

static int run_batch(const QCommandLineParser& cli)
{
    epc::Pain001Reader reader;
    epc::InitiationDocument doc;
    std::string err;

    if (!reader.parse_file(S(cli.value("pain001")), doc, &err)) {
        qCCritical(lcDemo, "Parse error: %s", err.c_str());
        return 1;
    }
    qCInfo(lcDemo, "Parsed %s: %d payment(s)", doc.header.msgId.c_str(), static_cast<int>(doc.payments.size()));

    epc::ExportOptions opt;
    opt.version = cli.value("version") == "1" ? epc::Version::V1 : epc::Version::V2;

    std::unique_ptr<std::ofstream> csv;
    if (cli.isSet("csv")) {
        csv = std::make_unique<std::ofstream>(S(cli.value("csv")), std::ios::binary);
        if (!*csv) {
            qCCritical(lcDemo, "Cannot write %s", qPrintable(cli.value("csv")));
            return 1;
        }
    }

    epc::ExportData rows;
    epc::export_payloads_csv(doc, csv.get(), &rows, opt);

    int failed = 0;
    for (size_t i = opt.include_header ? 1 : 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        const std::string& status = row[epc::to_index(epc::ExportField::Status)];
        const std::string& e2e = row[epc::to_index(epc::ExportField::EndToEndId)];
        if (status != "OK") {
            qCWarning(lcDemo, "%s: %s", e2e.c_str(), status.c_str());
            ++failed;
            continue;
        }
        qCDebug(lcDemo, "%s: %s", e2e.c_str(), row[epc::to_index(epc::ExportField::Payload)].c_str());
    }

    qCInfo(lcDemo, "%d transfer(s), %d failed", static_cast<int>(rows.size()) - (opt.include_header ? 1 : 0), failed);
    return failed == 0 ? 0 : 2;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("epc-payload-demo");
    qSetMessagePattern("[%{type}] %{category}: %{message}");

    QCommandLineParser cli;
    cli.setApplicationDescription("Creates EPC QR code payloads for SEPA credit transfers.");
    cli.addHelpOption();
    cli.addOptions({
        {"version",   "Payload version 1 or 2 (default 2).", "n", "2"},
        {"instant",   "SEPA Instant Credit Transfer (INST)."},
        {"bic",       "BIC of the beneficiary bank.", "bic"},
        {"name",      "Beneficiary name.", "name"},
        {"iban",      "Beneficiary IBAN.", "iban"},
        {"amount",    "Amount in EUR, e.g. 10.00.", "amount"},
        {"purpose",   "Four-letter purpose code.", "code"},
        {"reference", "RF creditor reference (or its body).", "ref"},
        {"text",      "Unstructured remittance text.", "text"},
        {"info",      "Beneficiary to originator information.", "info"},
        {"pain001",   "Create payloads for all transfers of a pain.001 file.", "file"},
        {"csv",       "Write the pain.001 payloads as CSV.", "file"},
        {"verbose",   "Debug output."},
    });
    cli.process(app);

    if (!cli.isSet("verbose"))
        QLoggingCategory::setFilterRules("epc.demo.debug=false");

    if (cli.value("version") != "1" && cli.value("version") != "2") {
        qCCritical(lcDemo, "Unknown version %s", qPrintable(cli.value("version")));
        return 1;
    }

    return cli.isSet("pain001") ? run_batch(cli) : run_single(cli);
}
