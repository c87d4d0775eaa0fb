#include "Log.h"

#include "Paths.h"

#include <QDateTime>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QTextStream>

namespace {

bool &debugFlag() {
    static bool enabled = qEnvironmentVariableIsSet("LUKS_VAULT_LOG_DEBUG");
    return enabled;
}

void rotateLogsIfNeeded(const QString &log) {
    QFileInfo fi(log); const qint64 maxSize = 1024*1024;
    if (fi.exists() && fi.size() > maxSize) { QFile::remove(log + ".2"); QFile::rename(log + ".1", log + ".2"); QFile::rename(log, log + ".1"); }
}

}

bool debugEnabled() { return debugFlag(); }

void setDebugLogging(bool enabled) { debugFlag() = enabled; }

void debugLog(const QString &message) {
    if (debugEnabled()) logEvent(message);
}

void logEvent(const QString &message) {
    const QString log = logFilePath();
    rotateLogsIfNeeded(log);
    QFile f(log);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) return;
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    QTextStream out(&f);
    out << QDateTime::currentDateTimeUtc().toString(Qt::ISODate) << " " << message << "\n";
}
