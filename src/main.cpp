#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLockFile>
#include <QProcessEnvironment>
#include <QTextStream>
#include <KLocalizedString>
#include <optional>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

#include "IdleHold.h"
#include "LocalBridge.h"
#include "Log.h"
#include "Paths.h"
#include "PostMountAction.h"
#include "Process.h"
#include "ProfileStore.h"
#include "RemoteExecutor.h"
#include "SessionWorkflow.h"
#include "Settings.h"
#include "TransportProbe.h"
#include "Trust.h"
#include "ui/ProfilePrompt.h"
#include "ui/SecurePasswordPrompt.h"

namespace {

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

void reportFailure(WorkflowError error, const QString &detail) {
    err() << i18n("Error: %1", describe(error));
    if (!detail.isEmpty()) err() << ": " << detail;
    err() << '\n';
    const QStringList causes = likelyCauses(error);
    if (!causes.isEmpty()) {
        err() << i18n("Potential issues:") << '\n';
        for (const QString &c : causes) err() << " - " << c << '\n';
    }
    err().flush();
}

// Piped stdin has no echo to turn off and is read through the same buffered stream as the prompts.
QByteArray readSecret(QTextStream &in, bool interactive, const QString &label, bool *ok) {
    if (interactive) return SecurePasswordPrompt::getSecurePassword(label, ok);
    err() << label; err().flush();
    QString line = in.readLine();
    if (ok) *ok = !line.isNull();
    QByteArray secret = line.toUtf8();
    secureZero(line);
    return secret;
}

bool checkDependencies(const CommandRunner &runner) {
    const QList<ToolProblem> problems = checkLocalTools(runner, requiredLocalTools());
    if (problems.isEmpty()) return true;
    err() << i18n("Error: Missing required dependencies:") << '\n';
    for (const ToolProblem &p : problems) err() << " - " << p.tool << " (" << p.reason << ")\n";
    for (const QString &hint : installHints(problems)) err() << i18n("To install on %1", hint) << '\n';
    err().flush();
    logEvent(QStringLiteral("dependency_check_failed"));
    return false;
}

}

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("luks-vault"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));
    KLocalizedString::setApplicationDomain("luks-vault");
    struct rlimit rlc{0,0}; setrlimit(RLIMIT_CORE, &rlc);
    prctl(PR_SET_DUMPABLE, 0);

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Unlock a remote LUKS volume and mount it locally over SSHFS"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption profileOpt(QStringLiteral("profile"), i18n("Use the saved configuration <name>."), QStringLiteral("name"));
    QCommandLineOption listOpt(QStringLiteral("list"), i18n("List saved configurations and exit."));
    QCommandLineOption configDirOpt(QStringLiteral("config-dir"), i18n("Configuration directory (default ~/.LUKS-VAULT)."), QStringLiteral("dir"));
    QCommandLineOption noFmOpt(QStringLiteral("no-file-manager"), i18n("Do not open a file manager after mounting."));
    QCommandLineOption verboseOpt(QStringLiteral("verbose"), i18n("Verbose ssh connection test and debug log lines."));
    parser.addOptions({profileOpt, listOpt, configDirOpt, noFmOpt, verboseOpt});
    parser.process(app);

    if (parser.isSet(configDirOpt)) setConfigRootPath(parser.value(configDirOpt));
    if (!ensurePrivateDir(configRootPath())) {
        err() << i18n("Cannot create a private configuration directory: %1", configRootPath()) << '\n';
        return 1;
    }

    VaultSettings settings = readSettings(settingsFilePath(), defaultMountDirPath());
    if (parser.isSet(noFmOpt)) settings.openFileManager = false;
    if (parser.isSet(verboseOpt)) { settings.verbose = true; setDebugLogging(true); }

    ProfileStore store(profileStorePath());
    if (parser.isSet(listOpt)) {
        for (const ConnectionProfile &p : store.loadAll()) out() << ProfilePrompt::describeProfile(p) << '\n';
        return 0;
    }

    out() << '\n' << i18n("=== Remote LUKS Vault Manager ===") << '\n';
    out().flush();

    QProcessRunner runner;
    if (!checkDependencies(runner)) return 1;

    QLockFile lock(lockFilePath());
    lock.setStaleLockTime(0);
    if (!lock.tryLock(100)) {
        lock.removeStaleLockFile();
        if (!lock.tryLock(100)) {
            err() << i18n("Another luks-vault session is already running") << '\n';
            return 1;
        }
    }

    QTextStream in(stdin, QIODevice::ReadOnly);
    const bool interactive = ::isatty(STDIN_FILENO);
    ProfilePrompt prompt(in, out(), [&in, interactive](const QString &label, bool *ok) {
        return readSecret(in, interactive, label, ok);
    });

    std::optional<ConnectionProfile> profile;
    if (parser.isSet(profileOpt)) {
        profile = store.find(parser.value(profileOpt));
        if (!profile) {
            err() << i18n("No saved configuration named %1", parser.value(profileOpt)) << '\n';
            return 1;
        }
    } else {
        profile = prompt.select(store.loadAll());
        if (profile && !prompt.confirmUse(*profile)) profile.reset();
    }
    if (!profile) {
        profile = prompt.create();
        if (!profile) {
            err() << i18n("Configuration aborted") << '\n';
            return 1;
        }
        QString saveErr;
        if (!store.save(profile->name, *profile, &saveErr)) {
            err() << i18n("Warning: configuration not saved: %1", saveErr) << '\n';
        }
    }

    if (isMountpointPath(settings.mountDir)) {
        err() << i18n("Warning: %1 is still mounted from an earlier session", settings.mountDir) << '\n';
        logEvent(QStringLiteral("stale_mount: ") + settings.mountDir);
    }

    IdleHold hold;
    hold.watchSignals();

    TcpProbe probe;
    RemoteExecutor remote(runner, settings);
    LocalBridge bridge(runner, settings);
    PostMountAction postMount(runner);
    SessionWorkflow workflow(probe, remote, bridge, settings);
    if (settings.openFileManager) {
        workflow.setPostMountAction(&postMount, PostMountAction::hasGraphicalDisplay(QProcessEnvironment::systemEnvironment()));
    }
    workflow.setProgressHandler([](const QString &message) { out() << message << '\n'; out().flush(); });
    workflow.setCancelCheck([&hold] { return hold.poll(); });

    Session session;
    session.localMountDir = settings.mountDir;

    out() << '\n' << i18n("Connecting to remote server...") << '\n';
    out().flush();
    QString detail;
    WorkflowError rc = workflow.connect(session, *profile, &detail);
    if (rc != WorkflowError::None) {
        reportFailure(rc, detail);
        err() << i18n("Connection failed") << '\n';
        return 1;
    }
    if (hold.poll()) {
        err() << i18n("%1 received, nothing was unlocked", hold.reason()) << '\n';
        workflow.disconnect(session);
        return 1;
    }

    out() << i18n("Mounting LUKS volume...") << '\n';
    out().flush();
    bool pwOk = false;
    QByteArray passphrase = readSecret(in, interactive, i18n("Enter LUKS passphrase: "), &pwOk);
    if (!pwOk || passphrase.isEmpty()) {
        secureZero(passphrase);
        if (hold.poll()) err() << '\n' << i18n("%1 received, nothing was unlocked", hold.reason()) << '\n';
        else err() << i18n("No passphrase given") << '\n';
        workflow.disconnect(session);
        return 1;
    }
    detail.clear();
    rc = workflow.mount(session, std::move(passphrase), &detail);
    if (rc != WorkflowError::None) {
        reportFailure(rc, detail);
        workflow.disconnect(session);
        return 1;
    }
    out() << '\n' << i18n("Successfully mounted!") << '\n' << i18n("Access files at: %1", session.localMountDir) << '\n';

    if (!hold.poll()) {
        out() << '\n' << i18n("Press Enter to unmount and disconnect...") << '\n';
        out().flush();
        hold.watchStdin();
        if (settings.lockOnSleep) hold.watchSleep();
    }
    const QString reason = hold.wait();
    if (reason != QLatin1String("continue")) out() << '\n' << i18n("%1 received, unmounting...", reason) << '\n';

    const UnwindReport report = workflow.disconnect(session);
    if (!report.ok()) err() << i18n("Warning: cleanup finished with errors, see %1", logFilePath()) << '\n';
    out() << '\n' << i18n("Operation completed") << '\n';
    return 0;
}
