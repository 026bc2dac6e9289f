#include "core/arch_audit_checker.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "core/arch_audit_parser.hpp"

namespace auditray {

ArchAuditChecker::ArchAuditChecker(std::string program, bool upgradableOnly)
    : m_program(std::move(program))
    , m_upgradableOnly(upgradableOnly)
{
}

QStringList ArchAuditChecker::arguments() const
{
    QStringList args{QStringLiteral("--json")};
    if (m_upgradableOnly) {
        args << QStringLiteral("--upgradable");
    }
    return args;
}

std::vector<Update> ArchAuditChecker::check()
{
    const QString program = QString::fromStdString(m_program);
    const ProcessOutput output = runAndCapture(program, arguments());

    if (output.exitCode != 0) {
        const QString stderrText =
            QString::fromUtf8(output.standardError).trimmed();
        std::string message = m_program + " exited with status "
            + std::to_string(output.exitCode);
        if (!stderrText.isEmpty()) {
            message += ": " + stderrText.toStdString();
        }
        throw CheckerError(message);
    }

    std::vector<Update> updates =
        parseArchAuditJson(output.standardOutput.toStdString());

    ALOG_DEBUG(QStringLiteral("ArchAuditChecker"),
               QStringLiteral("advisories_parsed"),
               (nlohmann::json{{"count", updates.size()}}));
    return updates;
}

} // namespace auditray
