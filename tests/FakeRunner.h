#pragma once

#include "Process.h"
#include "TransportProbe.h"

#include <QList>
#include <QSet>
#include <functional>

// Records every request and answers through a scripted responder. Without a
// responder every command succeeds with empty output.
class FakeRunner : public CommandRunner {
public:
    using Responder = std::function<ProcessResult(const ProcessRequest &)>;

    ProcessResult run(ProcessRequest request) override {
        requests.append(request);
        if (responder) return responder(request);
        ProcessResult r;
        r.exitCode = 0;
        return r;
    }

    bool startDetached(const QString &program, const QStringList &arguments) override {
        detached.append(program + QLatin1Char(' ') + arguments.join(QLatin1Char(' ')));
        return !failDetached.contains(program);
    }

    QString findExecutable(const QString &name) const override {
        return installed.contains(name) ? QStringLiteral("/usr/bin/") + name : QString();
    }

    // The remote command line is the last ssh argument.
    QStringList remoteCommands() const {
        QStringList cmds;
        for (const ProcessRequest &r : requests) {
            if (r.program == QLatin1String("sshpass")) cmds << r.arguments.last();
        }
        return cmds;
    }

    QList<ProcessRequest> requests;
    QStringList detached;
    QSet<QString> installed;
    QSet<QString> failDetached;
    Responder responder;
};

inline ProcessResult fakeResult(int exitCode, const QString &out = QString(), const QString &err = QString()) {
    ProcessResult r;
    r.exitCode = exitCode;
    r.standardOutput = out;
    r.standardError = err;
    return r;
}

class FakeProbe : public ReachabilityProbe {
public:
    bool isReachable(const QString &host, quint16 port, int timeoutMs) override {
        ++calls;
        lastHost = host;
        lastPort = port;
        lastTimeoutMs = timeoutMs;
        return reachable;
    }

    bool reachable = true;
    int calls = 0;
    QString lastHost;
    quint16 lastPort = 0;
    int lastTimeoutMs = 0;
};
