#pragma once

#include <QDBusMessage>
#include <QObject>
#include <QString>
#include <unistd.h>

class QSocketNotifier;

// Blocks the mounted session until something asks for the unwind: a line on
// stdin, SIGINT/SIGTERM/SIGHUP, or (when watched) screen lock / suspend.
class IdleHold : public QObject {
    Q_OBJECT
public:
    explicit IdleHold(QObject *parent = nullptr);
    ~IdleHold() override;

    bool watchSignals();
    bool watchStdin(int fd = STDIN_FILENO);
    bool watchSleep();

    // Picks up a signal that arrived while no event loop was running.
    bool poll();
    bool isTriggered() const { return m_triggered; }
    QString reason() const { return m_reason; }
    // Returns immediately when a trigger already arrived.
    QString wait();

public Q_SLOTS:
    void trigger(const QString &reason);
    void onSleepMessage(const QDBusMessage &msg);

Q_SIGNALS:
    void triggered(const QString &reason);

private Q_SLOTS:
    void onSignalReady();
    void onStdinReady();

private:
    static void signalHandler(int signum);

    QSocketNotifier *m_signalNotifier = nullptr;
    QSocketNotifier *m_stdinNotifier = nullptr;
    int m_stdinFd = -1;
    bool m_triggered = false;
    QString m_reason;
};
