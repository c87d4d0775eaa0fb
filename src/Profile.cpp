#include "Profile.h"

QStringList ConnectionProfile::missingFields() const {
    QStringList missing;
    if (name.trimmed().isEmpty()) missing << QStringLiteral("name");
    if (hostname.trimmed().isEmpty()) missing << QStringLiteral("hostname");
    if (port.trimmed().isEmpty()) missing << QStringLiteral("port");
    if (username.trimmed().isEmpty()) missing << QStringLiteral("username");
    if (password.isEmpty()) missing << QStringLiteral("password");
    if (device.trimmed().isEmpty()) missing << QStringLiteral("device");
    if (mapper.trimmed().isEmpty()) missing << QStringLiteral("mapper");
    if (mountPoint.trimmed().isEmpty()) missing << QStringLiteral("mount_point");
    return missing;
}

bool ConnectionProfile::hasSafeEndpoint() const {
    for (const QString *field : {&hostname, &username}) {
        if (field->startsWith('-')) return false;
        for (const QChar c : *field) {
            if (c.isSpace() || c == '@' || c == '/') return false;
        }
    }
    return !username.contains(':');
}

quint16 ConnectionProfile::portNumber() const {
    bool ok = false;
    const uint v = port.trimmed().toUInt(&ok);
    if (!ok || v == 0 || v > 65535) return 0;
    return static_cast<quint16>(v);
}

QString ConnectionProfile::endpoint() const {
    return hostname + ':' + (port.isEmpty() ? QStringLiteral("22") : port);
}

bool ConnectionProfile::operator==(const ConnectionProfile &other) const {
    return name == other.name && hostname == other.hostname && port == other.port
        && username == other.username && password == other.password && device == other.device
        && mapper == other.mapper && mountPoint == other.mountPoint;
}

bool isValidProfileName(const QString &name) {
    const QString n = name.trimmed();
    if (n.isEmpty()) return false;
    // QSettings maps [General] onto top-level keys.
    if (n.compare(QLatin1String("General"), Qt::CaseInsensitive) == 0) return false;
    if (n.contains('/') || n.contains('\\') || n.contains('[') || n.contains(']')) return false;
    return true;
}
