#include "SessionWorkflow.h"

#include "Log.h"
#include "PostMountAction.h"

#include <KLocalizedString>
#include <QDir>

namespace {

void enterState(Session &session, SessionState next) {
    if (session.state == next) return;
    debugLog(QStringLiteral("state: ") + stateName(session.state) + QStringLiteral(" -> ") + stateName(next));
    session.state = next;
}

QByteArray credentialLine(const ConnectionProfile &profile) {
    QByteArray line = profile.password.toUtf8();
    line.append('\n');
    return line;
}

RemoteCommand authProbeCommand() {
    return RemoteCommand::program(QStringLiteral("echo")).arg(SessionWorkflow::authMarker());
}

RemoteCommand toolCheckCommand() {
    return RemoteCommand::script(QStringLiteral("command -v cryptsetup || test -x /usr/sbin/cryptsetup || test -x /sbin/cryptsetup"));
}

// stdin: sudo password line, then the LUKS passphrase line read by cryptsetup.
RemoteCommand unlockCommand(const ConnectionProfile &p) {
    return RemoteCommand::program(QStringLiteral("cryptsetup"))
        .option(QStringLiteral("open")).option(QStringLiteral("--type")).option(QStringLiteral("luks"))
        .option(QStringLiteral("--")).arg(p.device).arg(p.mapper)
        .elevated();
}

// A failing chmod unmounts again inside the same script, so the caller only has
// to close the container.
RemoteCommand remoteMountCommand(const ConnectionProfile &p) {
    RemoteCommand mkdir = RemoteCommand::program(QStringLiteral("mkdir"));
    mkdir.option(QStringLiteral("-p")).option(QStringLiteral("--")).arg(p.mountPoint);
    RemoteCommand mount = RemoteCommand::program(QStringLiteral("mount"));
    mount.option(QStringLiteral("--")).arg(QStringLiteral("/dev/mapper/") + p.mapper).arg(p.mountPoint);
    RemoteCommand chmod = RemoteCommand::program(QStringLiteral("chmod"));
    chmod.option(QStringLiteral("-R")).option(QStringLiteral("777")).option(QStringLiteral("--")).arg(p.mountPoint);
    RemoteCommand undo = RemoteCommand::program(QStringLiteral("umount"));
    undo.option(QStringLiteral("--")).arg(p.mountPoint).andThen(RemoteCommand::program(QStringLiteral("false")));
    return mkdir.andThen(mount).andThen(chmod.orElse(undo.grouped()).grouped()).elevated();
}

RemoteCommand remoteUnmountCommand(const ConnectionProfile &p) {
    return RemoteCommand::program(QStringLiteral("umount")).option(QStringLiteral("--")).arg(p.mountPoint).elevated();
}

RemoteCommand closeCommand(const ConnectionProfile &p) {
    return RemoteCommand::program(QStringLiteral("cryptsetup"))
        .option(QStringLiteral("close")).option(QStringLiteral("--")).arg(p.mapper)
        .elevated();
}

}

QString SessionWorkflow::authMarker() { return QStringLiteral("LUKS_VAULT_CONNECTION_OK"); }

void SessionWorkflow::progress(const QString &message) const {
    if (m_progress) m_progress(message);
}

WorkflowError SessionWorkflow::connect(Session &session, const ConnectionProfile &profile, QString *detailOut) {
    if (session.connected) {
        return WorkflowError::AlreadyConnected;
    }
    if (!profile.isComplete() || !profile.hasSafeEndpoint()) {
        if (detailOut) *detailOut = profile.missingFields().join(QStringLiteral(", "));
        return WorkflowError::InvalidProfile;
    }
    enterState(session, SessionState::Connecting);
    logEvent(QStringLiteral("connect: ") + profile.name + QStringLiteral(" ") + profile.endpoint());

    const quint16 port = profile.portNumber();
    if (port == 0 || !m_probe.isReachable(profile.hostname, port, m_settings.probeTimeoutSec * 1000)) {
        enterState(session, SessionState::Idle);
        if (detailOut) *detailOut = i18n("Port %1 not reachable on %2", profile.port, profile.hostname);
        logEvent(QStringLiteral("connect_failed: port_unreachable"));
        return WorkflowError::PortUnreachable;
    }

    RemoteOptions authOpts;
    authOpts.verbose = m_settings.verbose;
    ProcessResult r = m_remote.run(profile, authProbeCommand(), authOpts);
    if (!r.standardOutput.contains(authMarker())) {
        enterState(session, SessionState::Idle);
        if (detailOut) *detailOut = r.standardError.trimmed();
        logEvent(QStringLiteral("connect_failed: auth rc=") + QString::number(r.exitCode));
        return WorkflowError::AuthenticationFailed;
    }

    r = m_remote.run(profile, toolCheckCommand());
    if (!r.ok()) {
        enterState(session, SessionState::Idle);
        if (detailOut) *detailOut = r.standardError.trimmed();
        logEvent(QStringLiteral("connect_failed: cryptsetup_missing"));
        return WorkflowError::RemoteToolMissing;
    }

    session.profile = profile;
    session.connected = true;
    enterState(session, SessionState::Connected);
    logEvent(QStringLiteral("connected: ") + profile.name);
    return WorkflowError::None;
}

WorkflowError SessionWorkflow::mount(Session &session, QByteArray passphrase, QString *detailOut) {
    if (!session.connected || !session.profile) {
        secureZero(passphrase);
        return WorkflowError::NotConnected;
    }
    if (session.mounted) {
        secureZero(passphrase);
        return WorkflowError::AlreadyMounted;
    }
    if (m_cancelled && m_cancelled()) {
        secureZero(passphrase);
        logEvent(QStringLiteral("mount_cancelled"));
        return WorkflowError::Cancelled;
    }
    const ConnectionProfile &p = *session.profile;

    enterState(session, SessionState::Unlocking);
    progress(i18n("[1/3] Unlocking LUKS container..."));
    RemoteOptions unlockOpts;
    unlockOpts.input = credentialLine(p);
    unlockOpts.input.append(passphrase);
    unlockOpts.input.append('\n');
    secureZero(passphrase);
    ProcessResult r = m_remote.run(p, unlockCommand(p), std::move(unlockOpts));
    if (!r.ok()) {
        enterState(session, SessionState::Connected);
        if (detailOut) *detailOut = r.standardError.trimmed();
        logEvent(QStringLiteral("unlock_failed: rc=") + QString::number(r.exitCode));
        if (r.standardError.contains(QLatin1String("No key available"))) return WorkflowError::WrongPassphrase;
        return WorkflowError::UnlockFailed;
    }

    progress(i18n("[2/3] Mounting LUKS volume on remote..."));
    RemoteOptions mountOpts;
    mountOpts.input = credentialLine(p);
    r = m_remote.run(p, remoteMountCommand(p), std::move(mountOpts));
    if (!r.ok()) {
        if (detailOut) *detailOut = r.standardError.trimmed();
        logEvent(QStringLiteral("remote_mount_failed: rc=") + QString::number(r.exitCode));
        QString err;
        if (!remoteClose(p, &err)) logEvent(QStringLiteral("rollback_close_failed: ") + err);
        enterState(session, SessionState::Connected);
        return WorkflowError::RemoteMountFailed;
    }
    enterState(session, SessionState::RemoteMounted);

    enterState(session, SessionState::Bridging);
    progress(i18n("[3/3] Mounting via SSHFS locally..."));
    WorkflowError bridgeError = WorkflowError::None;
    if (!QDir().mkpath(session.localMountDir)) {
        if (detailOut) *detailOut = i18n("Cannot create %1", session.localMountDir);
        logEvent(QStringLiteral("bridge_dir_failed: ") + session.localMountDir);
        bridgeError = WorkflowError::BridgeMountFailed;
    } else {
        r = m_bridge.mount(p, session.localMountDir);
        if (!r.ok()) {
            if (detailOut) *detailOut = r.standardError.trimmed();
            logEvent(QStringLiteral("bridge_mount_failed: rc=") + QString::number(r.exitCode));
            bridgeError = r.timedOut() ? WorkflowError::BridgeMountTimeout : WorkflowError::BridgeMountFailed;
        }
    }
    if (bridgeError != WorkflowError::None) {
        QString err;
        if (!remoteUnmount(p, &err)) logEvent(QStringLiteral("rollback_umount_failed: ") + err);
        if (!remoteClose(p, &err)) logEvent(QStringLiteral("rollback_close_failed: ") + err);
        enterState(session, SessionState::Connected);
        return bridgeError;
    }

    session.mounted = true;
    enterState(session, SessionState::Active);
    logEvent(QStringLiteral("mounted: ") + p.name + QStringLiteral(" -> ") + session.localMountDir);
    if (m_postMount) {
        const QString label = m_postMount->launch(session.localMountDir, m_hasDisplay);
        if (!label.isEmpty()) progress(i18n("Opened %1", label));
    }
    return WorkflowError::None;
}

UnwindReport SessionWorkflow::unwind(Session &session) {
    UnwindReport report;
    if (!session.mounted || !session.profile) {
        session.mounted = false;
        return report;
    }
    report.attempted = true;
    const ConnectionProfile &p = *session.profile;
    QString err;

    enterState(session, SessionState::Unbridging);
    progress(i18n("[1/3] Unmounting SSHFS..."));
    report.unbridged = m_bridge.unmount(session.localMountDir, &report.strategy, &err);
    if (!report.unbridged) {
        progress(i18n("Warning: Could not unmount %1", session.localMountDir));
        progress(i18n("Try manually: sudo umount -f %1", session.localMountDir));
    }

    enterState(session, SessionState::RemoteUnmounting);
    progress(i18n("[2/3] Unmounting remote volume..."));
    report.remoteUnmounted = remoteUnmount(p, &err);
    if (!report.remoteUnmounted) progress(i18n("Warning: remote unmount of %1 failed: %2", p.mountPoint, err));

    enterState(session, SessionState::Locking);
    progress(i18n("[3/3] Locking LUKS container..."));
    report.locked = remoteClose(p, &err);
    if (!report.locked) progress(i18n("Warning: closing %1 failed: %2", p.mapper, err));

    session.mounted = false;
    enterState(session, SessionState::Idle);
    logEvent(QStringLiteral("unwound: ok=") + (report.ok() ? QStringLiteral("1") : QStringLiteral("0")));
    if (report.ok()) progress(i18n("Volume successfully unmounted and locked"));
    return report;
}

UnwindReport SessionWorkflow::disconnect(Session &session) {
    UnwindReport report;
    if (session.mounted) report = unwind(session);
    session.connected = false;
    session.profile.reset();
    enterState(session, SessionState::Idle);
    logEvent(QStringLiteral("disconnected"));
    progress(i18n("Disconnected"));
    return report;
}

bool SessionWorkflow::remoteUnmount(const ConnectionProfile &profile, QString *errOut) {
    RemoteOptions opts;
    opts.input = credentialLine(profile);
    const ProcessResult r = m_remote.run(profile, remoteUnmountCommand(profile), std::move(opts));
    if (!r.ok() && errOut) *errOut = r.standardError.trimmed();
    return r.ok();
}

bool SessionWorkflow::remoteClose(const ConnectionProfile &profile, QString *errOut) {
    RemoteOptions opts;
    opts.input = credentialLine(profile);
    const ProcessResult r = m_remote.run(profile, closeCommand(profile), std::move(opts));
    if (!r.ok() && errOut) *errOut = r.standardError.trimmed();
    return r.ok();
}

QString stateName(SessionState state) {
    switch (state) {
    case SessionState::Idle: return QStringLiteral("Idle");
    case SessionState::Connecting: return QStringLiteral("Connecting");
    case SessionState::Connected: return QStringLiteral("Connected");
    case SessionState::Unlocking: return QStringLiteral("Unlocking");
    case SessionState::RemoteMounted: return QStringLiteral("RemoteMounted");
    case SessionState::Bridging: return QStringLiteral("Bridging");
    case SessionState::Active: return QStringLiteral("Active");
    case SessionState::Unbridging: return QStringLiteral("Unbridging");
    case SessionState::RemoteUnmounting: return QStringLiteral("RemoteUnmounting");
    case SessionState::Locking: return QStringLiteral("Locking");
    }
    return QString();
}

QString describe(WorkflowError error) {
    switch (error) {
    case WorkflowError::None: return QString();
    case WorkflowError::InvalidProfile: return i18n("The connection profile is incomplete or invalid");
    case WorkflowError::AlreadyConnected: return i18n("A session is already connected");
    case WorkflowError::NotConnected: return i18n("Not connected to SSH server");
    case WorkflowError::AlreadyMounted: return i18n("The volume is already mounted");
    case WorkflowError::PortUnreachable: return i18n("Port unreachable");
    case WorkflowError::AuthenticationFailed: return i18n("SSH connection failed");
    case WorkflowError::RemoteToolMissing: return i18n("cryptsetup not found on remote server");
    case WorkflowError::UnlockFailed: return i18n("Failed to unlock LUKS");
    case WorkflowError::WrongPassphrase: return i18n("Wrong passphrase or not a LUKS device");
    case WorkflowError::RemoteMountFailed: return i18n("Failed to mount the volume on the remote host");
    case WorkflowError::BridgeMountFailed: return i18n("SSHFS mount failed");
    case WorkflowError::BridgeMountTimeout: return i18n("Operation timed out - check network connection");
    case WorkflowError::Cancelled: return i18n("Cancelled before the volume was unlocked");
    }
    return QString();
}

QStringList likelyCauses(WorkflowError error) {
    switch (error) {
    case WorkflowError::InvalidProfile:
        return {i18n("Every field of the profile must be filled in"), i18n("Host and user must not start with '-' or contain '@', '/' or spaces")};
    case WorkflowError::PortUnreachable:
        return {i18n("Check firewall/port forwarding settings")};
    case WorkflowError::AuthenticationFailed:
        return {i18n("Incorrect credentials"), i18n("SSH server configuration"), i18n("Network restrictions")};
    case WorkflowError::RemoteToolMissing:
        return {i18n("Install with: sudo apt install cryptsetup")};
    case WorkflowError::UnlockFailed:
        return {i18n("sudo rejected the password or is not permitted for this user"), i18n("Device path does not exist"), i18n("Mapper name already in use")};
    case WorkflowError::WrongPassphrase:
        return {i18n("Check the LUKS passphrase and the device path")};
    case WorkflowError::RemoteMountFailed:
        return {i18n("Mount point busy or filesystem not recognised")};
    case WorkflowError::BridgeMountFailed:
        return {i18n("user_allow_other missing from /etc/fuse.conf"), i18n("FUSE not available on this machine"), i18n("Local mount directory busy")};
    case WorkflowError::BridgeMountTimeout:
        return {i18n("Network connection too slow or interrupted")};
    default:
        return {};
    }
}
