#include <QtTest/QtTest>

#include <string>

#include "common/errors.hpp"
#include "core/arch_audit_parser.hpp"

using auditray::CheckerError;

namespace {

bool rejects(const std::string &output)
{
    try {
        auditray::parseArchAuditJson(output);
    } catch (const CheckerError &) {
        return true;
    }
    return false;
}

} // namespace

class ArchAuditParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testAdvisoriesInDocumentOrder();
    void testOptionalFieldsOmitted();
    void testEmptyReport();
    void testMalformedOutput_data();
    void testMalformedOutput();
};

void ArchAuditParserTests::testAdvisoriesInDocumentOrder()
{
    const std::string output = R"([
        {"name": "AVG-2001", "packages": ["openssl", "lib32-openssl"],
         "status": "Fixed", "severity": "High", "type": "arbitrary code execution",
         "fixed": "3.1.2-1", "issues": ["CVE-2023-0001"]},
        {"name": "AVG-1999", "packages": ["curl"], "status": "Vulnerable",
         "severity": "Medium", "type": "denial of service", "fixed": null,
         "issues": ["CVE-2023-0002", "CVE-2023-0003"]}
    ])";

    const auto updates = auditray::parseArchAuditJson(output);
    QCOMPARE(updates.size(), static_cast<size_t>(2));

    QCOMPARE(QString::fromStdString(updates[0].text),
             QStringLiteral("openssl, lib32-openssl (AVG-2001): High - "
                            "arbitrary code execution [fixed in 3.1.2-1]"));
    QCOMPARE(QString::fromStdString(updates[0].link),
             QStringLiteral("https://security.archlinux.org/AVG-2001"));

    // Not re-sorted by advisory number.
    QCOMPARE(QString::fromStdString(updates[1].text),
             QStringLiteral("curl (AVG-1999): Medium - denial of service"));
    QCOMPARE(QString::fromStdString(updates[1].link),
             QStringLiteral("https://security.archlinux.org/AVG-1999"));
}

void ArchAuditParserTests::testOptionalFieldsOmitted()
{
    const auto onlyRequired =
        auditray::parseArchAuditJson(R"([{"name": "AVG-5", "packages": ["zlib"]}])");
    QCOMPARE(onlyRequired.size(), static_cast<size_t>(1));
    QCOMPARE(QString::fromStdString(onlyRequired[0].text), QStringLiteral("zlib (AVG-5)"));

    const auto onlyType = auditray::parseArchAuditJson(
        R"([{"name": "AVG-6", "packages": ["vim"], "type": "information disclosure"}])");
    QCOMPARE(QString::fromStdString(onlyType[0].text),
             QStringLiteral("vim (AVG-6): information disclosure"));
}

void ArchAuditParserTests::testEmptyReport()
{
    QVERIFY(auditray::parseArchAuditJson("[]").empty());
    QVERIFY(auditray::parseArchAuditJson("").empty());
    QVERIFY(auditray::parseArchAuditJson("  \n").empty());
}

void ArchAuditParserTests::testMalformedOutput_data()
{
    QTest::addColumn<QString>("output");
    QTest::newRow("not json") << QStringLiteral("openssl is affected");
    QTest::newRow("object") << QStringLiteral(R"({"name": "AVG-1"})");
    QTest::newRow("entry not object") << QStringLiteral(R"(["AVG-1"])");
    QTest::newRow("missing name") << QStringLiteral(R"([{"packages": ["a"]}])");
    QTest::newRow("missing packages") << QStringLiteral(R"([{"name": "AVG-1"}])");
    QTest::newRow("empty packages") << QStringLiteral(R"([{"name": "AVG-1", "packages": []}])");
    QTest::newRow("package not string")
        << QStringLiteral(R"([{"name": "AVG-1", "packages": [3]}])");
    QTest::newRow("severity not string")
        << QStringLiteral(R"([{"name": "AVG-1", "packages": ["a"], "severity": 4}])");
    QTest::newRow("foreign name")
        << QStringLiteral(R"([{"name": "../../evil", "packages": ["a"]}])");
}

void ArchAuditParserTests::testMalformedOutput()
{
    QFETCH(QString, output);
    QVERIFY(rejects(output.toStdString()));
}

QTEST_MAIN(ArchAuditParserTests)
#include "test_arch_audit_parser.moc"
