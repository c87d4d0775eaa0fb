#pragma once

#include <QString>

// Root of all per-user state: $LUKS_VAULT_HOME, else ~/.LUKS-VAULT.
QString configRootPath();
void setConfigRootPath(const QString &path);

QString profileStorePath();
QString settingsFilePath();
QString logFilePath();
QString lockFilePath();
QString defaultMountDirPath();

bool ensurePrivateDir(const QString &path);
bool isDirPermissionsSecure(const QString &path);
bool isMountpointPath(const QString &path);
