#include "Process.h"

#include "Log.h"

#include <QDir>
#include <QProcess>
#include <QStandardPaths>
#include <cstring>
#include <string.h>

namespace {

const char *const kDangerousVars[] = {"LD_PRELOAD","LD_LIBRARY_PATH","LD_AUDIT","LD_ASSUME_KERNEL","GCONV_PATH","HOSTALIASES","PYTHONPATH","RUBYLIB","NODE_PATH","PERL5LIB","DYLD_INSERT_LIBRARIES"};

}

QStringList trustedSearchPaths() {
    return {QStringLiteral("/usr/local/bin"), QStringLiteral("/usr/bin"), QStringLiteral("/bin"),
            QStringLiteral("/usr/local/sbin"), QStringLiteral("/usr/sbin"), QStringLiteral("/sbin")};
}

QProcessEnvironment safeEnvVars() {
    QProcessEnvironment env;
    env.insert("PATH", trustedSearchPaths().join(':'));
    env.insert("LANG", "C");
    env.insert("LC_ALL", "C");
    env.insert("HOME", QDir::homePath());
    for (const char *k : {"USER", "LOGNAME", "XDG_RUNTIME_DIR", "TMPDIR", "SSH_AUTH_SOCK"}) {
        const QString v = qEnvironmentVariable(k);
        if (!v.isEmpty()) env.insert(QString::fromLatin1(k), v);
    }
    for (const char *k : kDangerousVars) env.remove(QString::fromLatin1(k));
    return env;
}

QProcessEnvironment safeGuiEnvVars() {
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (const char *k : kDangerousVars) env.remove(QString::fromLatin1(k));
    env.remove(QStringLiteral("QT_PLUGIN_PATH"));
    env.remove(QStringLiteral("SSHPASS"));
    return env;
}

void secureZero(QByteArray &bytes) {
    if (bytes.isEmpty()) return;
    explicit_bzero(bytes.data(), static_cast<size_t>(bytes.size()));
    bytes.clear();
}

void secureZero(QString &text) {
    if (text.isEmpty()) return;
    explicit_bzero(text.data(), static_cast<size_t>(text.size()) * sizeof(QChar));
    text.clear();
}

ProcessResult QProcessRunner::run(ProcessRequest request) {
    ProcessResult result;
    const QString program = QDir::isAbsolutePath(request.program) ? request.program : findExecutable(request.program);
    if (program.isEmpty()) {
        secureZero(request.input);
        result.standardError = QStringLiteral("%1 not found in trusted path").arg(request.program);
        debugLog(QStringLiteral("process_not_found: ") + request.program);
        return result;
    }
    QProcessEnvironment env = safeEnvVars();
    for (auto it = request.environment.constBegin(); it != request.environment.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }

    QProcess p;
    p.setProgram(program);
    p.setArguments(request.arguments);
    p.setProcessEnvironment(env);
    p.setProcessChannelMode(QProcess::SeparateChannels);
    p.start();
    if (!p.waitForStarted(5000)) {
        secureZero(request.input);
        result.exitCode = -1;
        result.standardError = QStringLiteral("failed to start %1: %2").arg(program, p.errorString());
        debugLog(QStringLiteral("process_start_failed: ") + program);
        return result;
    }
    if (!request.input.isEmpty()) p.write(request.input);
    secureZero(request.input);
    p.closeWriteChannel();
    if (!p.waitForFinished(request.timeoutMs)) {
        p.kill();
        p.waitForFinished(2000);
        result.exitCode = -2;
        result.standardOutput = QString::fromUtf8(p.readAllStandardOutput());
        result.standardError = QStringLiteral("timeout");
        debugLog(QStringLiteral("process_timeout: ") + program);
        return result;
    }
    result.standardOutput = QString::fromUtf8(p.readAllStandardOutput());
    result.standardError = QString::fromUtf8(p.readAllStandardError());
    if (p.exitStatus() != QProcess::NormalExit) {
        result.exitCode = -3;
        if (result.standardError.isEmpty()) result.standardError = QStringLiteral("crash");
        return result;
    }
    result.exitCode = p.exitCode();
    return result;
}

bool QProcessRunner::startDetached(const QString &program, const QStringList &arguments) {
    QProcess p;
    p.setProgram(QDir::isAbsolutePath(program) ? program : findExecutable(program));
    p.setArguments(arguments);
    p.setProcessEnvironment(safeGuiEnvVars());
    p.setStandardInputFile(QProcess::nullDevice());
    p.setStandardOutputFile(QProcess::nullDevice());
    p.setStandardErrorFile(QProcess::nullDevice());
    if (p.program().isEmpty()) return false;
    return p.startDetached();
}

QString QProcessRunner::findExecutable(const QString &name) const {
    return QStandardPaths::findExecutable(name, trustedSearchPaths());
}
