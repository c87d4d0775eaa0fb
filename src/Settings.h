#pragma once

#include <QString>

struct VaultSettings {
    int probeTimeoutSec = 5;
    int sshConnectTimeoutSec = 15;
    int remoteTimeoutSec = 60;
    int bridgeTimeoutSec = 30;
    int serverAliveInterval = 20;
    int serverAliveCount = 5;
    QString strictHostKeyChecking = QStringLiteral("accept-new");
    bool openFileManager = true;
    bool lockOnSleep = false;
    bool verbose = false;
    QString mountDir;
};

// KEY=VALUE lines; unknown keys are ignored, bad values fall back or get clamped.
VaultSettings readSettings(const QString &path, const QString &defaultMountDir);
