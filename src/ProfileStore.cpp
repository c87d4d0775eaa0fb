#include "ProfileStore.h"

#include "Log.h"

#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>

namespace {

// Hand-edited values with unquoted commas come back as lists.
QString readString(const QSettings &s, const QString &key) {
    const QVariant v = s.value(key);
    if (v.typeId() == QMetaType::QStringList) return v.toStringList().join(QLatin1Char(','));
    return v.toString();
}

}

QList<ConnectionProfile> ProfileStore::loadAll() const {
    QList<ConnectionProfile> profiles;
    if (!QFileInfo::exists(m_path)) return profiles;
    QSettings s(m_path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        logEvent(QStringLiteral("profile_store_unreadable: ") + m_path);
        return profiles;
    }
    const QStringList groups = s.childGroups();
    for (const QString &group : groups) {
        s.beginGroup(group);
        ConnectionProfile p;
        p.name = group;
        p.hostname = readString(s, QStringLiteral("hostname"));
        p.port = readString(s, QStringLiteral("port"));
        p.username = readString(s, QStringLiteral("username"));
        p.password = readString(s, QStringLiteral("password"));
        p.device = readString(s, QStringLiteral("device"));
        p.mapper = readString(s, QStringLiteral("mapper"));
        p.mountPoint = readString(s, QStringLiteral("mount_point"));
        s.endGroup();
        profiles.append(p);
    }
    return profiles;
}

std::optional<ConnectionProfile> ProfileStore::find(const QString &name) const {
    const QList<ConnectionProfile> profiles = loadAll();
    for (const ConnectionProfile &p : profiles) {
        if (p.name == name) return p;
    }
    return std::nullopt;
}

bool ProfileStore::save(const QString &name, const ConnectionProfile &profile, QString *errOut) const {
    if (!isValidProfileName(name)) {
        if (errOut) *errOut = QStringLiteral("invalid profile name: %1").arg(name);
        return false;
    }
    {
        QSettings s(m_path, QSettings::IniFormat);
        s.beginGroup(name.trimmed());
        s.remove(QString());
        s.setValue(QStringLiteral("hostname"), profile.hostname);
        s.setValue(QStringLiteral("port"), profile.port);
        s.setValue(QStringLiteral("username"), profile.username);
        s.setValue(QStringLiteral("password"), profile.password);
        s.setValue(QStringLiteral("device"), profile.device);
        s.setValue(QStringLiteral("mapper"), profile.mapper);
        s.setValue(QStringLiteral("mount_point"), profile.mountPoint);
        s.endGroup();
        s.sync();
        if (s.status() != QSettings::NoError) {
            if (errOut) *errOut = QStringLiteral("cannot write %1").arg(m_path);
            logEvent(QStringLiteral("profile_save_failed: ") + name);
            return false;
        }
    }
    QFile::setPermissions(m_path, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    logEvent(QStringLiteral("profile_saved: ") + name);
    return true;
}
