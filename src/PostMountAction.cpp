#include "PostMountAction.h"

#include "Log.h"
#include "Process.h"

const QList<FileManager> &PostMountAction::candidates() {
    static const QList<FileManager> managers = {
        {QStringLiteral("thunar"), QStringLiteral("Thunar (XFCE)")},
        {QStringLiteral("dolphin"), QStringLiteral("Dolphin (KDE)")},
        {QStringLiteral("nautilus"), QStringLiteral("Nautilus (GNOME)")},
        {QStringLiteral("pcmanfm"), QStringLiteral("PCManFM (LXDE)")},
        {QStringLiteral("nemo"), QStringLiteral("Nemo (Cinnamon)")},
    };
    return managers;
}

bool PostMountAction::hasGraphicalDisplay(const QProcessEnvironment &env) {
    return !env.value(QStringLiteral("DISPLAY")).isEmpty() || !env.value(QStringLiteral("WAYLAND_DISPLAY")).isEmpty();
}

QString PostMountAction::launch(const QString &mountDir, bool hasDisplay) {
    if (!hasDisplay) {
        logEvent(QStringLiteral("file_manager_skipped: no display"));
        return QString();
    }
    for (const FileManager &fm : candidates()) {
        const QString path = m_runner.findExecutable(fm.executable);
        if (path.isEmpty()) continue;
        if (m_runner.startDetached(path, {mountDir})) {
            logEvent(QStringLiteral("file_manager_started: ") + fm.executable);
            return fm.label;
        }
        logEvent(QStringLiteral("file_manager_failed: ") + fm.executable);
    }
    logEvent(QStringLiteral("file_manager_none"));
    return QString();
}
