#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace auditray {

struct ProcessOutput {
    int exitCode = 0;
    QByteArray standardOutput;
    QByteArray standardError;
};

// Run program to completion and capture both output channels.
// Blocks without a timeout. Throws CheckerError if the program cannot be
// started or crashes; a non-zero exit code is returned, not thrown.
ProcessOutput runAndCapture(const QString &program, const QStringList &args);

} // namespace auditray
