#include "Trust.h"

#include "Log.h"
#include "Process.h"

#include <QFile>
#include <QFileInfo>
#include <QTextStream>
#include <QRegularExpression>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

bool isRootHostUidMapped() {
    QFile f(QStringLiteral("/proc/self/uid_map"));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return true;
    }
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QStringList parts = in.readLine().trimmed().split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        if (parts.size() >= 3) {
            bool ok1 = false, ok2 = false;
            const quint64 outside = parts.at(1).toULongLong(&ok1);
            const quint64 length = parts.at(2).toULongLong(&ok2);
            if (ok1 && ok2 && outside == 0 && length > 0) {
                return true;
            }
        }
    }
    return false;
}

bool isRootOwnedConsideringUserNS(uid_t uid) {
    if (uid == 0) return true;
    const uid_t OVERFLOW_UID = 65534;
    if (uid == OVERFLOW_UID && !isRootHostUidMapped()) return true;
    return false;
}

}

// Symlinks are followed (fusermount is a link to fusermount3 on fuse3 systems);
// the target has to satisfy the checks.
bool isExecutableTrustedDetailed(const QString &path, QString *reasonOut) {
    QFileInfo fi(path);
    if (!fi.exists()) { if (reasonOut) *reasonOut = QStringLiteral("not found"); return false; }
    if (!fi.isExecutable()) { if (reasonOut) *reasonOut = QStringLiteral("not executable"); return false; }
    const QString real = fi.canonicalFilePath();
    if (real.isEmpty()) { if (reasonOut) *reasonOut = QStringLiteral("canonicalize failed"); return false; }
    if (!(real.startsWith("/usr/") || real.startsWith("/bin/") || real.startsWith("/sbin/"))) {
        if (reasonOut) *reasonOut = QStringLiteral("outside trusted prefix");
        return false;
    }
    QByteArray rba = QFile::encodeName(real);
    int fd = ::open(rba.constData(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (fd < 0) { if (reasonOut) *reasonOut = QStringLiteral("open failed"); return false; }
    struct stat st{};
    const bool ok = (::fstat(fd, &st) == 0);
    ::close(fd);
    if (!ok) { if (reasonOut) *reasonOut = QStringLiteral("stat failed"); return false; }
    if (!S_ISREG(st.st_mode)) { if (reasonOut) *reasonOut = QStringLiteral("not a regular file"); return false; }
    if (!isRootOwnedConsideringUserNS(st.st_uid)) { if (reasonOut) *reasonOut = QStringLiteral("not root-owned"); return false; }
    if ((st.st_mode & S_IWGRP) || (st.st_mode & S_IWOTH)) { if (reasonOut) *reasonOut = QStringLiteral("world-writable"); return false; }
    return true;
}

QList<ToolRequirement> requiredLocalTools() {
    return {
        ToolRequirement{{QStringLiteral("sshpass")}},
        ToolRequirement{{QStringLiteral("ssh")}},
        ToolRequirement{{QStringLiteral("sshfs")}},
        ToolRequirement{{QStringLiteral("fusermount3"), QStringLiteral("fusermount")}},
        ToolRequirement{{QStringLiteral("umount")}},
    };
}

QList<ToolProblem> checkLocalTools(const CommandRunner &runner, const QList<ToolRequirement> &tools, bool verifyTrust) {
    QList<ToolProblem> problems;
    for (const ToolRequirement &req : tools) {
        QString lastReason = QStringLiteral("not found");
        bool satisfied = false;
        for (const QString &name : req.alternatives) {
            const QString path = runner.findExecutable(name);
            if (path.isEmpty()) continue;
            QString reason;
            if (!verifyTrust || isExecutableTrustedDetailed(path, &reason)) {
                satisfied = true;
                break;
            }
            lastReason = QStringLiteral("%1 untrusted (%2)").arg(path, reason);
            logEvent(QStringLiteral("tool_trust_fail: ") + path + QStringLiteral(" reason=") + reason);
        }
        if (!satisfied) problems.append(ToolProblem{req.alternatives.join(QLatin1Char('/')), lastReason});
    }
    return problems;
}

QStringList installHints(const QList<ToolProblem> &problems) {
    bool needsSshfs = false;
    for (const ToolProblem &p : problems) {
        if (p.tool.contains(QLatin1String("sshfs")) || p.tool.contains(QLatin1String("sshpass")) || p.tool.contains(QLatin1String("fusermount"))) needsSshfs = true;
    }
    if (!needsSshfs) return {};
    return {
        QStringLiteral("Debian/Ubuntu: sudo apt install sshfs sshpass"),
        QStringLiteral("Arch: sudo pacman -S sshfs sshpass"),
        QStringLiteral("Fedora: sudo dnf install fuse-sshfs sshpass"),
    };
}
