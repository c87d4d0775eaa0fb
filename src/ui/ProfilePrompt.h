#pragma once

#include "Profile.h"

#include <QByteArray>
#include <QList>
#include <QString>
#include <QTextStream>
#include <functional>
#include <optional>
#include <utility>

// Console dialogue for choosing a saved profile or creating a new one.
// Required fields are asked again until they are non-empty.
class ProfilePrompt {
public:
    using SecretReader = std::function<QByteArray(const QString &prompt, bool *ok)>;

    ProfilePrompt(QTextStream &in, QTextStream &out, SecretReader readSecret)
        : m_in(in), m_out(out), m_readSecret(std::move(readSecret)) {}

    // nullopt when the user picks "create new", gives an invalid choice, or
    // there is nothing to pick from.
    std::optional<ConnectionProfile> select(const QList<ConnectionProfile> &profiles);
    bool confirmUse(const ConnectionProfile &profile);
    // nullopt only on end of input.
    std::optional<ConnectionProfile> create();

    static QString describeProfile(const ConnectionProfile &profile);

private:
    // Null string on end of input.
    QString ask(const QString &label);
    QString askRequired(const QString &label, const QString &emptyMessage, const QString &defaultValue = QString());

    QTextStream &m_in;
    QTextStream &m_out;
    SecretReader m_readSecret;
};
