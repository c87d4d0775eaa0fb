#pragma once

#include <QString>
#include <QStringList>

struct ConnectionProfile {
    QString name;
    QString hostname;
    QString port;
    QString username;
    QString password;
    QString device;
    QString mapper;
    QString mountPoint;

    // Names of the fields that are still empty, in prompt order.
    QStringList missingFields() const;
    bool isComplete() const { return missingFields().isEmpty(); }
    // Host and user end up as "user@host" words on ssh/sshfs command lines.
    bool hasSafeEndpoint() const;
    // 0 when the port text is not a valid TCP port.
    quint16 portNumber() const;
    QString endpoint() const;

    bool operator==(const ConnectionProfile &other) const;
    bool operator!=(const ConnectionProfile &other) const { return !(*this == other); }
};

bool isValidProfileName(const QString &name);
