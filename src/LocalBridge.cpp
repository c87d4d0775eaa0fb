#include "LocalBridge.h"

#include "Log.h"

#include <unistd.h>
#include <utility>

QStringList LocalBridge::mountArguments(const ConnectionProfile &profile, const QString &localDir) const {
    const QString host = profile.hostname.contains(':') ? QStringLiteral("[%1]").arg(profile.hostname) : profile.hostname;
    QStringList args;
    args << QStringLiteral("-p") << (profile.port.isEmpty() ? QStringLiteral("22") : profile.port)
         << QStringLiteral("-o") << QStringLiteral("reconnect")
         << QStringLiteral("-o") << QStringLiteral("ServerAliveInterval=%1").arg(m_settings.serverAliveInterval)
         << QStringLiteral("-o") << QStringLiteral("ServerAliveCountMax=%1").arg(m_settings.serverAliveCount)
         << QStringLiteral("-o") << QStringLiteral("ConnectTimeout=%1").arg(m_settings.sshConnectTimeoutSec)
         << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=%1").arg(m_settings.strictHostKeyChecking)
         << QStringLiteral("-o") << QStringLiteral("password_stdin")
         << QStringLiteral("-o") << QStringLiteral("uid=%1").arg(getuid())
         << QStringLiteral("-o") << QStringLiteral("gid=%1").arg(getgid())
         << QStringLiteral("-o") << QStringLiteral("allow_other")
         << QStringLiteral("%1@%2:%3").arg(profile.username, host, profile.mountPoint)
         << localDir;
    return args;
}

ProcessResult LocalBridge::mount(const ConnectionProfile &profile, const QString &localDir) {
    ProcessRequest req;
    req.program = QStringLiteral("sshfs");
    req.arguments = mountArguments(profile, localDir);
    req.input = profile.password.toUtf8();
    req.input.append('\n');
    req.timeoutMs = m_settings.bridgeTimeoutSec * 1000;
    debugLog(QStringLiteral("bridge_mount: ") + profile.endpoint() + QStringLiteral(" -> ") + localDir);
    return m_runner.run(std::move(req));
}

QList<UnmountStrategy> LocalBridge::unmountStrategies(const QString &localDir) const {
    QString fusermount = m_runner.findExecutable(QStringLiteral("fusermount3"));
    if (fusermount.isEmpty()) fusermount = QStringLiteral("fusermount");
    return {
        {QStringLiteral("fusermount -u"), fusermount, {QStringLiteral("-u"), localDir}},
        {QStringLiteral("umount -l"), QStringLiteral("umount"), {QStringLiteral("-l"), localDir}},
        {QStringLiteral("sudo umount -l"), QStringLiteral("sudo"), {QStringLiteral("-n"), QStringLiteral("umount"), QStringLiteral("-l"), localDir}},
        {QStringLiteral("sudo umount"), QStringLiteral("sudo"), {QStringLiteral("-n"), QStringLiteral("umount"), localDir}},
    };
}

bool LocalBridge::unmount(const QString &localDir, QString *usedOut, QString *errOut) {
    QString lastErr;
    const QList<UnmountStrategy> strategies = unmountStrategies(localDir);
    for (const UnmountStrategy &s : strategies) {
        ProcessRequest req;
        req.program = s.program;
        req.arguments = s.arguments;
        req.timeoutMs = 15000;
        const ProcessResult r = m_runner.run(std::move(req));
        if (r.ok()) {
            if (usedOut) *usedOut = s.label;
            logEvent(QStringLiteral("bridge_unmounted: ") + s.label);
            return true;
        }
        lastErr = r.standardError.trimmed();
        debugLog(QStringLiteral("unmount_strategy_failed: ") + s.label + QStringLiteral(" rc=") + QString::number(r.exitCode));
    }
    if (errOut) *errOut = lastErr;
    logEvent(QStringLiteral("bridge_unmount_failed: ") + localDir);
    return false;
}
