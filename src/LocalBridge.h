#pragma once

#include "Process.h"
#include "Profile.h"
#include "Settings.h"

#include <QList>

struct UnmountStrategy {
    QString label;
    QString program;
    QStringList arguments;
};

// sshfs mount of the remote mount point into the local mount directory, and
// the ordered list of ways to get rid of it again.
class LocalBridge {
public:
    LocalBridge(CommandRunner &runner, const VaultSettings &settings)
        : m_runner(runner), m_settings(settings) {}

    ProcessResult mount(const ConnectionProfile &profile, const QString &localDir);
    // Tries each strategy in order and stops at the first success.
    bool unmount(const QString &localDir, QString *usedOut = nullptr, QString *errOut = nullptr);

    QStringList mountArguments(const ConnectionProfile &profile, const QString &localDir) const;
    QList<UnmountStrategy> unmountStrategies(const QString &localDir) const;

private:
    CommandRunner &m_runner;
    const VaultSettings &m_settings;
};
