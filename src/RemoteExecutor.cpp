#include "RemoteExecutor.h"

#include "Log.h"

#include <utility>

QStringList RemoteExecutor::sshArguments(const ConnectionProfile &profile, const RemoteCommand &command, const RemoteOptions &options) const {
    QStringList args;
    args << QStringLiteral("-e") << QStringLiteral("ssh")
         << QStringLiteral("-p") << (profile.port.isEmpty() ? QStringLiteral("22") : profile.port);
    if (options.requestTty) args << QStringLiteral("-tt");
    if (options.verbose) args << QStringLiteral("-v");
    args << QStringLiteral("-o") << QStringLiteral("ConnectTimeout=%1").arg(m_settings.sshConnectTimeoutSec)
         << QStringLiteral("-o") << QStringLiteral("StrictHostKeyChecking=%1").arg(m_settings.strictHostKeyChecking)
         << QStringLiteral("-o") << QStringLiteral("NumberOfPasswordPrompts=1")
         << QStringLiteral("--")
         << QStringLiteral("%1@%2").arg(profile.username, profile.hostname)
         << command.toShell();
    return args;
}

ProcessResult RemoteExecutor::run(const ConnectionProfile &profile, const RemoteCommand &command, RemoteOptions options) {
    ProcessRequest req;
    req.program = QStringLiteral("sshpass");
    req.arguments = sshArguments(profile, command, options);
    req.environment.insert(QStringLiteral("SSHPASS"), profile.password);
    req.input = std::move(options.input);
    req.timeoutMs = options.timeoutMs > 0 ? options.timeoutMs : m_settings.remoteTimeoutSec * 1000;
    debugLog(QStringLiteral("remote_run: ") + profile.endpoint() + QStringLiteral(" ") + command.toShell());
    ProcessResult r = m_runner.run(std::move(req));
    if (!r.ok()) {
        debugLog(QStringLiteral("remote_rc: ") + QString::number(r.exitCode));
    }
    return r;
}
