#pragma once

#include "Profile.h"

#include <QList>
#include <QString>
#include <optional>

// INI store, one group per profile. Read-modify-write without locking.
class ProfileStore {
public:
    explicit ProfileStore(const QString &path) : m_path(path) {}

    QList<ConnectionProfile> loadAll() const;
    std::optional<ConnectionProfile> find(const QString &name) const;
    bool save(const QString &name, const ConnectionProfile &profile, QString *errOut = nullptr) const;

    const QString &path() const { return m_path; }

private:
    QString m_path;
};
