#include "Paths.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStringList>
#include <QTextStream>
#include <sys/stat.h>
#include <unistd.h>

namespace {

QString &configRootOverride() {
    static QString path;
    return path;
}

QString decodeOctalEscapes(const QString &in) {
    QString out; out.reserve(in.size());
    for (int i = 0; i < in.size(); ++i) {
        if (in[i] == '\\' && i + 3 < in.size()) {
            if (in[i+1].isDigit() && in[i+2].isDigit() && in[i+3].isDigit()) {
                int v = (in[i+1].unicode() - '0') * 64 + (in[i+2].unicode() - '0') * 8 + (in[i+3].unicode() - '0');
                out.append(QChar(v)); i += 3; continue;
            }
        }
        out.append(in[i]);
    }
    return out;
}

QString normalizeForCompare(const QString &p) {
    QString n = QFileInfo(p).absoluteFilePath(); if (n.endsWith('/')) n.chop(1); return n;
}

}

QString configRootPath() {
    if (!configRootOverride().isEmpty()) return configRootOverride();
    const QString env = qEnvironmentVariable("LUKS_VAULT_HOME");
    if (!env.isEmpty()) return env;
    return QDir::homePath() + "/.LUKS-VAULT";
}

void setConfigRootPath(const QString &path) {
    configRootOverride() = QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

QString profileStorePath() { return configRootPath() + "/config"; }
QString settingsFilePath() { return configRootPath() + "/vault.conf"; }
QString logFilePath() { return configRootPath() + "/luks-vault.log"; }
QString lockFilePath() { return configRootPath() + "/luks-vault.lock"; }
QString defaultMountDirPath() { return configRootPath() + "/mnt"; }

bool ensurePrivateDir(const QString &path) {
    const QByteArray encoded = QFile::encodeName(path);
    struct stat st{};
    if (::lstat(encoded.constData(), &st) == 0) {
        if (S_ISLNK(st.st_mode) || !S_ISDIR(st.st_mode)) {
            return false;
        }
        if (st.st_uid != getuid()) {
            return false;
        }
        if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
            if (::chmod(encoded.constData(), S_IRWXU) != 0) {
                return false;
            }
        }
        return true;
    }

    QDir dir;
    if (!dir.mkpath(path)) {
        return false;
    }
    if (::chmod(encoded.constData(), S_IRWXU) != 0) {
        return false;
    }
    return isDirPermissionsSecure(path);
}

bool isDirPermissionsSecure(const QString &path) {
    const QByteArray encoded = QFile::encodeName(path);
    struct stat st{};
    if (::lstat(encoded.constData(), &st) != 0) {
        return false;
    }
    if (S_ISLNK(st.st_mode) || !S_ISDIR(st.st_mode)) {
        return false;
    }
    if (st.st_uid != getuid()) {
        return false;
    }
    return (st.st_mode & 07777) == 0700;
}

bool isMountpointPath(const QString &path) {
    const QString needle = normalizeForCompare(path);
    QFile f(QStringLiteral("/proc/self/mountinfo"));
    if (!f.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }
    QTextStream in(&f);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        const QStringList parts = line.split(' ');
        if (parts.size() >= 5) {
            const QString mp = normalizeForCompare(decodeOctalEscapes(parts.at(4)));
            if (mp == needle) {
                return true;
            }
        }
    }
    return false;
}
