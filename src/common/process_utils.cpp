#include "common/process_utils.hpp"

#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace auditray {

ProcessOutput runAndCapture(const QString &program, const QStringList &args)
{
    ALOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("process_start"),
               (nlohmann::json{{"program", program.toStdString()},
                               {"args", args.join(' ').toStdString()}}));

    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted(-1)) {
        throw CheckerError("failed to start " + program.toStdString() + ": "
                           + process.errorString().toStdString());
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(-1)) {
        throw CheckerError(program.toStdString() + " did not finish: "
                           + process.errorString().toStdString());
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        throw CheckerError(program.toStdString() + " crashed");
    }

    ProcessOutput output;
    output.exitCode = process.exitCode();
    output.standardOutput = process.readAllStandardOutput();
    output.standardError = process.readAllStandardError();

    ALOG_DEBUG(QStringLiteral("ProcessUtils"),
               QStringLiteral("process_finished"),
               (nlohmann::json{{"program", program.toStdString()},
                               {"exitCode", output.exitCode},
                               {"stdoutBytes", output.standardOutput.size()}}));
    return output;
}

} // namespace auditray
