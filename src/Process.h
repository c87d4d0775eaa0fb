#pragma once

#include <QByteArray>
#include <QHash>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

struct ProcessRequest {
    QString program;
    QStringList arguments;
    // Written to stdin, then stdin is closed. Wiped by the runner once delivered.
    QByteArray input;
    QHash<QString, QString> environment;
    int timeoutMs = 30000;
};

struct ProcessResult {
    // -1 failed to start, -2 timeout, -3 crash
    int exitCode = -1;
    QString standardOutput;
    QString standardError;

    bool ok() const { return exitCode == 0; }
    bool timedOut() const { return exitCode == -2; }
};

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual ProcessResult run(ProcessRequest request) = 0;
    virtual bool startDetached(const QString &program, const QStringList &arguments) = 0;
    // Empty when not found in the trusted search path.
    virtual QString findExecutable(const QString &name) const = 0;
};

class QProcessRunner : public CommandRunner {
public:
    ProcessResult run(ProcessRequest request) override;
    bool startDetached(const QString &program, const QStringList &arguments) override;
    QString findExecutable(const QString &name) const override;
};

QStringList trustedSearchPaths();
QProcessEnvironment safeEnvVars();
QProcessEnvironment safeGuiEnvVars();
void secureZero(QByteArray &bytes);
void secureZero(QString &text);
