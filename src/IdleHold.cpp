#include "IdleHold.h"

#include "Log.h"

#include <QDBusConnection>
#include <QDBusConnectionInterface>
#include <QDBusMessage>
#include <QEventLoop>
#include <QSocketNotifier>
#include <QStringList>
#include <cerrno>
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

namespace {

int g_signalFd[2] = {-1, -1};
const int kWatchedSignals[] = {SIGINT, SIGTERM, SIGHUP};

QString signalName(int signum) {
    switch (signum) {
    case SIGINT: return QStringLiteral("SIGINT");
    case SIGTERM: return QStringLiteral("SIGTERM");
    case SIGHUP: return QStringLiteral("SIGHUP");
    default: return QStringLiteral("signal %1").arg(signum);
    }
}

}

IdleHold::IdleHold(QObject *parent) : QObject(parent) {}

IdleHold::~IdleHold() {
    if (m_signalNotifier) {
        struct sigaction sa{};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        for (int sig : kWatchedSignals) ::sigaction(sig, &sa, nullptr);
        delete m_signalNotifier;
        m_signalNotifier = nullptr;
        ::close(g_signalFd[0]);
        ::close(g_signalFd[1]);
        g_signalFd[0] = g_signalFd[1] = -1;
    }
}

void IdleHold::signalHandler(int signum) {
    const char c = static_cast<char>(signum);
    const ssize_t n = ::write(g_signalFd[0], &c, 1);
    (void)n;
}

bool IdleHold::watchSignals() {
    if (m_signalNotifier) return true;
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, g_signalFd) != 0) {
        logEvent(QStringLiteral("signal_socketpair_failed"));
        return false;
    }
    m_signalNotifier = new QSocketNotifier(g_signalFd[1], QSocketNotifier::Read, this);
    connect(m_signalNotifier, &QSocketNotifier::activated, this, &IdleHold::onSignalReady);

    struct sigaction sa{};
    sa.sa_handler = &IdleHold::signalHandler;
    sigemptyset(&sa.sa_mask);
    // Without SA_RESTART, so a blocking prompt read returns EINTR.
    sa.sa_flags = 0;
    for (int sig : kWatchedSignals) {
        if (::sigaction(sig, &sa, nullptr) != 0) {
            logEvent(QStringLiteral("sigaction_failed: ") + signalName(sig));
            return false;
        }
    }
    return true;
}

bool IdleHold::watchStdin(int fd) {
    if (m_stdinNotifier) return true;
    m_stdinFd = fd;
    m_stdinNotifier = new QSocketNotifier(fd, QSocketNotifier::Read, this);
    connect(m_stdinNotifier, &QSocketNotifier::activated, this, &IdleHold::onStdinReady);
    return true;
}

bool IdleHold::watchSleep() {
    bool any = false;
    any |= QDBusConnection::sessionBus().connect("org.freedesktop.ScreenSaver", "/org/freedesktop/ScreenSaver", "org.freedesktop.ScreenSaver", "ActiveChanged", this, SLOT(onSleepMessage(QDBusMessage)));
    any |= QDBusConnection::sessionBus().connect("org.kde.screensaver", "/ScreenSaver", "org.freedesktop.ScreenSaver", "ActiveChanged", this, SLOT(onSleepMessage(QDBusMessage)));
    any |= QDBusConnection::systemBus().connect("org.freedesktop.login1", "/org/freedesktop/login1", "org.freedesktop.login1.Manager", "PrepareForSleep", this, SLOT(onSleepMessage(QDBusMessage)));
    if (!any) logEvent(QStringLiteral("dbus_watch_unavailable"));
    return any;
}

bool IdleHold::poll() {
    if (m_triggered || !m_signalNotifier) return m_triggered;
    char c = 0;
    if (::recv(g_signalFd[1], &c, 1, MSG_DONTWAIT) == 1) trigger(signalName(static_cast<unsigned char>(c)));
    return m_triggered;
}

QString IdleHold::wait() {
    if (m_triggered) return m_reason;
    QEventLoop loop;
    connect(this, &IdleHold::triggered, &loop, &QEventLoop::quit);
    loop.exec();
    return m_reason;
}

void IdleHold::trigger(const QString &reason) {
    if (m_triggered) return;
    m_triggered = true;
    m_reason = reason;
    logEvent(QStringLiteral("unwind_trigger: ") + reason);
    Q_EMIT triggered(reason);
}

void IdleHold::onSignalReady() {
    char c = 0;
    if (::read(g_signalFd[1], &c, 1) != 1) return;
    trigger(signalName(static_cast<unsigned char>(c)));
}

void IdleHold::onStdinReady() {
    char buf[256];
    const ssize_t n = ::read(m_stdinFd, buf, sizeof buf);
    if (n < 0 && errno == EINTR) return;
    if (n <= 0) {
        m_stdinNotifier->setEnabled(false);
        trigger(QStringLiteral("stdin closed"));
        return;
    }
    for (ssize_t i = 0; i < n; ++i) {
        if (buf[i] == '\n') {
            trigger(QStringLiteral("continue"));
            return;
        }
    }
}

void IdleHold::onSleepMessage(const QDBusMessage &msg) {
    const QString member = msg.member();
    if ((member != QLatin1String("ActiveChanged") && member != QLatin1String("PrepareForSleep")) || !msg.signature().contains('b')) {
        return;
    }
    const QString sender = msg.service();
    QStringList owners;
    if (auto si = QDBusConnection::sessionBus().interface()) {
        auto a = si->serviceOwner("org.freedesktop.ScreenSaver"); if (a.isValid()) owners << a.value();
        auto b = si->serviceOwner("org.kde.screensaver"); if (b.isValid()) owners << b.value();
    }
    if (auto sy = QDBusConnection::systemBus().interface()) {
        auto c = sy->serviceOwner("org.freedesktop.login1"); if (c.isValid()) owners << c.value();
    }
    if (!owners.contains(sender)) {
        logEvent(QStringLiteral("dbus_reject: ") + sender);
        return;
    }
    const auto args = msg.arguments();
    if (!args.isEmpty() && args.at(0).toBool()) {
        trigger(member == QLatin1String("PrepareForSleep") ? QStringLiteral("suspend") : QStringLiteral("screen locked"));
    }
}
