#pragma once

#include "LocalBridge.h"
#include "Profile.h"
#include "RemoteExecutor.h"
#include "Settings.h"
#include "TransportProbe.h"

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>
#include <utility>

class PostMountAction;

enum class SessionState {
    Idle,
    Connecting,
    Connected,
    Unlocking,
    RemoteMounted,
    Bridging,
    Active,
    Unbridging,
    RemoteUnmounting,
    Locking,
};

enum class WorkflowError {
    None,
    InvalidProfile,
    AlreadyConnected,
    NotConnected,
    AlreadyMounted,
    PortUnreachable,
    AuthenticationFailed,
    RemoteToolMissing,
    UnlockFailed,
    WrongPassphrase,
    RemoteMountFailed,
    BridgeMountFailed,
    BridgeMountTimeout,
    Cancelled,
};

// Passed explicitly through every workflow step. mounted implies connected.
struct Session {
    SessionState state = SessionState::Idle;
    bool connected = false;
    bool mounted = false;
    std::optional<ConnectionProfile> profile;
    QString localMountDir;
};

struct UnwindReport {
    bool attempted = false;
    bool unbridged = false;
    bool remoteUnmounted = false;
    bool locked = false;
    QString strategy;

    bool ok() const { return !attempted || (unbridged && remoteUnmounted && locked); }
};

class SessionWorkflow {
public:
    using ProgressHandler = std::function<void(const QString &)>;
    using CancelCheck = std::function<bool()>;

    SessionWorkflow(ReachabilityProbe &probe, RemoteExecutor &remote, LocalBridge &bridge, const VaultSettings &settings)
        : m_probe(probe), m_remote(remote), m_bridge(bridge), m_settings(settings) {}

    void setPostMountAction(PostMountAction *action, bool hasDisplay) { m_postMount = action; m_hasDisplay = hasDisplay; }
    void setProgressHandler(ProgressHandler handler) { m_progress = std::move(handler); }
    // Asked before the volume is unlocked; true aborts the mount with Cancelled.
    void setCancelCheck(CancelCheck check) { m_cancelled = std::move(check); }

    // Idle -> Connected. On failure the session is left untouched and Idle.
    WorkflowError connect(Session &session, const ConnectionProfile &profile, QString *detailOut = nullptr);
    // Connected -> Active: unlock, remote mount, bridge mount. A failing step
    // undoes only the steps before it. The passphrase is wiped.
    WorkflowError mount(Session &session, QByteArray passphrase, QString *detailOut = nullptr);
    // Active -> Idle. Every teardown step is attempted; mounted is false afterwards.
    UnwindReport unwind(Session &session);
    UnwindReport disconnect(Session &session);

    static QString authMarker();

private:
    bool remoteUnmount(const ConnectionProfile &profile, QString *errOut);
    bool remoteClose(const ConnectionProfile &profile, QString *errOut);
    void progress(const QString &message) const;

    ReachabilityProbe &m_probe;
    RemoteExecutor &m_remote;
    LocalBridge &m_bridge;
    const VaultSettings &m_settings;
    PostMountAction *m_postMount = nullptr;
    bool m_hasDisplay = false;
    ProgressHandler m_progress;
    CancelCheck m_cancelled;
};

QString stateName(SessionState state);
QString describe(WorkflowError error);
QStringList likelyCauses(WorkflowError error);
