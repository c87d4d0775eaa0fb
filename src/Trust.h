#pragma once

#include <QList>
#include <QString>
#include <QStringList>

class CommandRunner;

bool isExecutableTrustedDetailed(const QString &path, QString *reasonOut);

struct ToolRequirement {
    // Any one of the alternatives satisfies the requirement.
    QStringList alternatives;
};

struct ToolProblem {
    QString tool;
    QString reason;
};

QList<ToolRequirement> requiredLocalTools();
// With verifyTrust off only presence is checked.
QList<ToolProblem> checkLocalTools(const CommandRunner &runner, const QList<ToolRequirement> &tools, bool verifyTrust = true);
QStringList installHints(const QList<ToolProblem> &problems);
