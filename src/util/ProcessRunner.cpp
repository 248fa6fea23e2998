#include "util/ProcessRunner.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace QtDocAssembly { namespace util {

QString ProcessResult::diagnostic() const
{
    if (!started) return startError.isEmpty() ? QStringLiteral("failed to start") : QStringLiteral("failed to start: ") + startError;
    const QString err = stdErr.trimmed();
    if (!err.isEmpty()) return timedOut ? QStringLiteral("timed out; ") + err : err;
    const QString out = stdOut.trimmed();
    if (!out.isEmpty()) return timedOut ? QStringLiteral("timed out; ") + out : out;
    if (timedOut) return QStringLiteral("timed out");
    if (crashed) return QStringLiteral("crashed");
    return QStringLiteral("exit code %1").arg(exitCode);
}

ProcessResult ProcessRunner::run(const QString &program,
                                 const QStringList &args,
                                 const QProcessEnvironment &env,
                                 int timeoutMs,
                                 const QString &workingDir)
{
    QProcess p;
    p.setProcessEnvironment(env);
    if (!workingDir.isEmpty()) p.setWorkingDirectory(workingDir);

    ProcessResult r;
    p.start(program, args);
    if (!p.waitForStarted()) {
        r.startError = p.errorString();
        return r;
    }
    r.started = true;

    if (timeoutMs > 0) {
        if (!p.waitForFinished(timeoutMs)) {
            r.timedOut = true;
            p.kill();
            p.waitForFinished(2000);
        }
    } else {
        p.waitForFinished(-1);
    }

    r.stdOut = QString::fromLocal8Bit(p.readAllStandardOutput());
    r.stdErr = QString::fromLocal8Bit(p.readAllStandardError());
    r.crashed = !r.timedOut && p.exitStatus() == QProcess::CrashExit;
    r.exitCode = p.exitCode();
    return r;
}

QString ProcessRunner::findExecutable(const QString &nameOrPath)
{
    const QString candidate = nameOrPath.trimmed();
    if (candidate.isEmpty()) return QString();
    if (candidate.contains(QLatin1Char('/')) || candidate.contains(QLatin1Char('\\'))) {
        QFileInfo fi(candidate);
        return (fi.isFile() && fi.isExecutable()) ? fi.absoluteFilePath() : QString();
    }
    // QStandardPaths::findExecutable handles PATH search and suffixes on Windows
    return QStandardPaths::findExecutable(candidate);
}

}} // namespace QtDocAssembly::util
