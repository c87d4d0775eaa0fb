#pragma once

#include "Process.h"
#include "Profile.h"
#include "RemoteCommand.h"
#include "Settings.h"

struct RemoteOptions {
    bool requestTty = false;
    bool verbose = false;
    QByteArray input;
    // 0 uses the configured remote timeout.
    int timeoutMs = 0;
};

// Runs commands on the profile's host through sshpass + ssh. The login
// password reaches sshpass through SSHPASS, never through argv.
class RemoteExecutor {
public:
    RemoteExecutor(CommandRunner &runner, const VaultSettings &settings)
        : m_runner(runner), m_settings(settings) {}

    ProcessResult run(const ConnectionProfile &profile, const RemoteCommand &command, RemoteOptions options = {});
    QStringList sshArguments(const ConnectionProfile &profile, const RemoteCommand &command, const RemoteOptions &options) const;

private:
    CommandRunner &m_runner;
    const VaultSettings &m_settings;
};
