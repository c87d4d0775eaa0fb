#pragma once

#include <QString>

// Action log under the config root. Never pass secrets in here.
void logEvent(const QString &message);
void debugLog(const QString &message);
void setDebugLogging(bool enabled);
bool debugEnabled();
