#include "Settings.h"

#include "Log.h"

#include <QDir>
#include <QFile>
#include <QRegularExpression>
#include <QTextStream>

namespace {

int clampedInt(const QString &value, int fallback, int lo, int hi) {
    bool ok = false;
    int v = value.toInt(&ok);
    if (!ok) return fallback;
    if (v < lo) v = lo;
    if (v > hi) v = hi;
    return v;
}

bool parseFlag(const QString &value, bool fallback) {
    if (value == QLatin1String("1") || value.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0) return true;
    if (value == QLatin1String("0") || value.compare(QLatin1String("false"), Qt::CaseInsensitive) == 0) return false;
    return fallback;
}

}

VaultSettings readSettings(const QString &path, const QString &defaultMountDir) {
    VaultSettings s;
    s.mountDir = defaultMountDir;
    QFile f(path); if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) return s;
    QTextStream in(&f);
    const QRegularExpression re(QStringLiteral("^([A-Z_]{1,64})=(.*)$"));
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#') || line.size() > 4096) continue;
        const auto m = re.match(line);
        if (!m.hasMatch()) { debugLog(QStringLiteral("settings_skip: ") + line.left(64)); continue; }
        const QString key = m.captured(1);
        const QString value = m.captured(2).trimmed();
        if (key == QLatin1String("PROBE_TIMEOUT")) s.probeTimeoutSec = clampedInt(value, s.probeTimeoutSec, 1, 60);
        else if (key == QLatin1String("SSH_CONNECT_TIMEOUT")) s.sshConnectTimeoutSec = clampedInt(value, s.sshConnectTimeoutSec, 1, 120);
        else if (key == QLatin1String("REMOTE_TIMEOUT")) s.remoteTimeoutSec = clampedInt(value, s.remoteTimeoutSec, 5, 600);
        else if (key == QLatin1String("BRIDGE_TIMEOUT")) s.bridgeTimeoutSec = clampedInt(value, s.bridgeTimeoutSec, 5, 300);
        else if (key == QLatin1String("SERVER_ALIVE_INTERVAL")) s.serverAliveInterval = clampedInt(value, s.serverAliveInterval, 1, 600);
        else if (key == QLatin1String("SERVER_ALIVE_COUNT")) s.serverAliveCount = clampedInt(value, s.serverAliveCount, 1, 100);
        else if (key == QLatin1String("STRICT_HOST_KEY_CHECKING")) {
            if (value == QLatin1String("yes") || value == QLatin1String("no") || value == QLatin1String("accept-new")) s.strictHostKeyChecking = value;
        }
        else if (key == QLatin1String("OPEN_FILE_MANAGER")) s.openFileManager = parseFlag(value, s.openFileManager);
        else if (key == QLatin1String("LOCK_ON_SLEEP")) s.lockOnSleep = parseFlag(value, s.lockOnSleep);
        else if (key == QLatin1String("MOUNT_DIR")) {
            if (QDir::isAbsolutePath(value)) s.mountDir = QDir::cleanPath(value);
        }
    }
    return s;
}
