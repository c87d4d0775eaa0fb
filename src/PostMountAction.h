#pragma once

#include <QList>
#include <QProcessEnvironment>
#include <QString>

class CommandRunner;

struct FileManager {
    QString executable;
    QString label;
};

// Opens a file manager on the freshly mounted directory. Fire and forget:
// nothing here reports back into the session.
class PostMountAction {
public:
    explicit PostMountAction(CommandRunner &runner) : m_runner(runner) {}

    // Returns the label of the launched file manager, or an empty string.
    QString launch(const QString &mountDir, bool hasDisplay);

    static const QList<FileManager> &candidates();
    static bool hasGraphicalDisplay(const QProcessEnvironment &env);

private:
    CommandRunner &m_runner;
};
