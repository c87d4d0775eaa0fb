#include "RemoteCommand.h"

#include <QRegularExpression>

RemoteCommand RemoteCommand::program(const QString &name) {
    RemoteCommand c;
    c.m_tokens << name;
    return c;
}

RemoteCommand RemoteCommand::script(const QString &trustedShell) {
    RemoteCommand c;
    c.m_tokens << trustedShell;
    return c;
}

RemoteCommand &RemoteCommand::option(const QString &trustedToken) {
    m_tokens << trustedToken;
    return *this;
}

RemoteCommand &RemoteCommand::arg(const QString &value) {
    m_tokens << quote(value);
    return *this;
}

RemoteCommand &RemoteCommand::andThen(const RemoteCommand &next) {
    m_tokens << QStringLiteral("&&") << next.toShell();
    return *this;
}

RemoteCommand &RemoteCommand::orElse(const RemoteCommand &next) {
    m_tokens << QStringLiteral("||") << next.toShell();
    return *this;
}

RemoteCommand RemoteCommand::elevated() const {
    RemoteCommand c = program(QStringLiteral("sudo"));
    c.option(QStringLiteral("-S")).option(QStringLiteral("-k")).option(QStringLiteral("-p")).arg(QString());
    c.option(QStringLiteral("--")).option(QStringLiteral("sh")).option(QStringLiteral("-c")).arg(toShell());
    return c;
}

RemoteCommand RemoteCommand::grouped() const {
    RemoteCommand c;
    c.m_tokens << QStringLiteral("{") << toShell() + QLatin1Char(';') << QStringLiteral("}");
    return c;
}

QString RemoteCommand::toShell() const {
    return m_tokens.join(QLatin1Char(' '));
}

QString RemoteCommand::quote(const QString &value) {
    if (value.isEmpty()) return QStringLiteral("''");
    static const QRegularExpression safe(QStringLiteral("^[A-Za-z0-9_@%+=:,./-]+$"));
    if (safe.match(value).hasMatch()) return value;
    QString escaped = value;
    escaped.replace(QLatin1Char('\''), QStringLiteral("'\\''"));
    return QLatin1Char('\'') + escaped + QLatin1Char('\'');
}
