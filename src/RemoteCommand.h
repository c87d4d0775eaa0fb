#pragma once

#include <QString>
#include <QStringList>

// Builds a remote shell command line. Program names, options and scripts are
// trusted literals from this code base; everything passed through arg() is
// quoted so that device paths, mapper names and mount points coming from a
// profile cannot change the command structure.
class RemoteCommand {
public:
    static RemoteCommand program(const QString &name);
    static RemoteCommand script(const QString &trustedShell);

    RemoteCommand &option(const QString &trustedToken);
    RemoteCommand &arg(const QString &value);
    RemoteCommand &andThen(const RemoteCommand &next);
    RemoteCommand &orElse(const RemoteCommand &next);

    // Runs the whole command as root through sudo, reading the sudo password
    // from the first line of stdin. Cached sudo credentials are ignored so
    // that the first line is always consumed by sudo.
    RemoteCommand elevated() const;
    // Wraps the command in a "{ ...; }" group so it chains as one unit.
    RemoteCommand grouped() const;

    QString toShell() const;
    bool isEmpty() const { return m_tokens.isEmpty(); }

    static QString quote(const QString &value);

private:
    RemoteCommand() = default;

    QStringList m_tokens;
};
