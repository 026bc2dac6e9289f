#pragma once

#include <string>
#include <vector>

#include <QStringList>

#include "core/advisory_checker.hpp"

namespace auditray {

// Runs arch-audit as a subprocess and parses its JSON report.
class ArchAuditChecker : public AdvisoryChecker
{
public:
    ArchAuditChecker(std::string program, bool upgradableOnly);

    std::vector<Update> check() override;

    QStringList arguments() const;

private:
    std::string m_program;
    bool m_upgradableOnly;
};

} // namespace auditray
