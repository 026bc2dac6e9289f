#include <QtTest/QtTest>

#include "common/json_utils.hpp"
#include "common/status_model.hpp"

using auditray::CheckOutcome;
using auditray::Icon;
using auditray::Status;
using auditray::StatusKind;
using auditray::Update;

namespace {

std::vector<Update> twoUpdates()
{
    return {
        {"openssl (AVG-1): High - arbitrary code execution",
         "https://security.archlinux.org/AVG-1"},
        {"curl (AVG-2): Medium - denial of service",
         "https://security.archlinux.org/AVG-2"},
    };
}

} // namespace

class StatusModelTests : public QObject
{
    Q_OBJECT
private slots:
    void testClassifyEmptySuccess();
    void testClassifyUpdates();
    void testClassifyFailure();
    void testPresentIsTotal();
    void testPresentTexts();
    void testEmptyMissingUpdatesReadsAsUpToDate();
    void testIconNames();
};

void StatusModelTests::testClassifyEmptySuccess()
{
    const Status status = auditray::classify(CheckOutcome::success({}));
    QCOMPARE(status.kind, StatusKind::UpToDate);
    QCOMPARE(auditray::present(status).icon, Icon::Check);
}

void StatusModelTests::testClassifyUpdates()
{
    const Status status = auditray::classify(CheckOutcome::success(twoUpdates()));
    QCOMPARE(status.kind, StatusKind::MissingUpdates);
    QCOMPARE(status.updates.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(status.updates[0].link),
             QStringLiteral("https://security.archlinux.org/AVG-1"));
    QCOMPARE(QString::fromStdString(status.updates[1].link),
             QStringLiteral("https://security.archlinux.org/AVG-2"));
    QCOMPARE(auditray::present(status).icon, Icon::Alert);
    QVERIFY(auditray::hasUpdateList(status));
}

void StatusModelTests::testClassifyFailure()
{
    const Status status =
        auditray::classify(CheckOutcome::failure("tool not found"));
    QCOMPARE(status.kind, StatusKind::Error);
    QCOMPARE(QString::fromStdString(status.message), QStringLiteral("tool not found"));
    QCOMPARE(auditray::present(status).icon, Icon::Cross);

    const Status anonymous = auditray::classify(CheckOutcome::failure(""));
    QCOMPARE(anonymous.kind, StatusKind::Error);
    QVERIFY(!anonymous.message.empty());
}

void StatusModelTests::testPresentIsTotal()
{
    const std::vector<Status> statuses = {
        Status::checking(),
        Status::upToDate(),
        Status::missingUpdates({}),
        Status::missingUpdates({twoUpdates().front()}),
        Status::missingUpdates(twoUpdates()),
        Status::error(""),
        Status::error("exit status 1"),
    };

    for (const Status &status : statuses) {
        const auto presentation = auditray::present(status);
        QVERIFY(!presentation.text.empty());
        QVERIFY(auditray::parseIconName(auditray::toIconName(presentation.icon)).has_value());
    }
}

void StatusModelTests::testPresentTexts()
{
    QCOMPARE(QString::fromStdString(auditray::present(Status::checking()).text),
             QStringLiteral("Checking..."));
    QCOMPARE(QString::fromStdString(auditray::present(Status::upToDate()).text),
             QStringLiteral("No vulnerable packages"));
    QCOMPARE(QString::fromStdString(
                 auditray::present(Status::missingUpdates({twoUpdates().front()})).text),
             QStringLiteral("1 vulnerable package"));
    QCOMPARE(QString::fromStdString(
                 auditray::present(Status::missingUpdates(twoUpdates())).text),
             QStringLiteral("2 vulnerable packages"));
    QCOMPARE(QString::fromStdString(
                 auditray::present(Status::error("tool not found")).text),
             QStringLiteral("ERROR: tool not found"));
}

void StatusModelTests::testEmptyMissingUpdatesReadsAsUpToDate()
{
    const Status empty = Status::missingUpdates({});
    const auto presentation = auditray::present(empty);
    const auto upToDate = auditray::present(Status::upToDate());

    QCOMPARE(QString::fromStdString(presentation.text),
             QString::fromStdString(upToDate.text));
    QCOMPARE(presentation.icon, Icon::Check);
    QVERIFY(!auditray::hasUpdateList(empty));
}

void StatusModelTests::testIconNames()
{
    QCOMPARE(QString::fromStdString(auditray::toIconName(Icon::Check)), QStringLiteral("check"));
    QCOMPARE(QString::fromStdString(auditray::toIconName(Icon::Alert)), QStringLiteral("alert"));
    QCOMPARE(QString::fromStdString(auditray::toIconName(Icon::Cross)), QStringLiteral("cross"));

    QCOMPARE(*auditray::parseIconName("alert"), Icon::Alert);
    QVERIFY(!auditray::parseIconName("Alert").has_value());
    QVERIFY(!auditray::parseIconName("").has_value());
    QVERIFY(!auditray::parseIconName("warning").has_value());
}

QTEST_MAIN(StatusModelTests)
#include "test_status_model.moc"
