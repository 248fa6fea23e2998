#ifndef QTDOCASSEMBLY_PROCESS_RUNNER_HPP
#define QTDOCASSEMBLY_PROCESS_RUNNER_HPP

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace QtDocAssembly { namespace util {

struct ProcessResult {
    bool started = false;
    bool crashed = false;
    bool timedOut = false;
    int exitCode = -1;
    QString stdOut;
    QString stdErr;
    QString startError;

    bool succeeded() const { return started && !crashed && !timedOut && exitCode == 0; }
    /** Trimmed stderr, else trimmed stdout, else a description of how the process ended. */
    QString diagnostic() const;
};

// Process execution without a shell; every run is bounded by a deadline.
class ProcessRunner {
  public:
    // Run program with args. Timeout ms (<= 0 = wait forever). The process is killed on expiry.
    static ProcessResult run(const QString &program,
                             const QStringList &args,
                             const QProcessEnvironment &env = QProcessEnvironment::systemEnvironment(),
                             int timeoutMs = 0,
                             const QString &workingDir = QString());

    // Absolute path of an executable: names are looked up in PATH, paths must exist and be executable.
    static QString findExecutable(const QString &nameOrPath);
};

}} // namespace QtDocAssembly::util

#endif // QTDOCASSEMBLY_PROCESS_RUNNER_HPP
