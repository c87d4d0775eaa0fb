#include "ProfilePrompt.h"

#include "Process.h"

#include <KLocalizedString>

QString ProfilePrompt::describeProfile(const ConnectionProfile &profile) {
    return QStringLiteral("%1 (%2:%3)").arg(profile.name, profile.hostname, profile.port.isEmpty() ? QStringLiteral("22") : profile.port);
}

QString ProfilePrompt::ask(const QString &label) {
    m_out << label;
    m_out.flush();
    QString line = m_in.readLine();
    if (line.isNull()) return QString();
    line = line.trimmed();
    // Keep "answered with nothing" distinguishable from end of input.
    if (line.isEmpty()) return QStringLiteral("");
    return line;
}

QString ProfilePrompt::askRequired(const QString &label, const QString &emptyMessage, const QString &defaultValue) {
    for (;;) {
        const QString answer = ask(label);
        if (answer.isNull()) return QString();
        if (!answer.isEmpty()) return answer;
        if (!defaultValue.isEmpty()) return defaultValue;
        m_out << emptyMessage << '\n';
    }
}

std::optional<ConnectionProfile> ProfilePrompt::select(const QList<ConnectionProfile> &profiles) {
    if (profiles.isEmpty()) return std::nullopt;
    m_out << '\n' << i18n("Saved configurations:") << '\n';
    for (int i = 0; i < profiles.size(); ++i) {
        m_out << (i + 1) << ". " << describeProfile(profiles.at(i)) << '\n';
    }
    m_out << '\n' << i18n("0. Create new configuration") << '\n';
    const QString answer = ask(QStringLiteral("\n") + i18n("Select configuration (number): "));
    bool ok = false;
    const int choice = answer.toInt(&ok);
    if (!ok || choice < 1 || choice > profiles.size()) return std::nullopt;
    return profiles.at(choice - 1);
}

bool ProfilePrompt::confirmUse(const ConnectionProfile &profile) {
    m_out << '\n' << i18n("Using configuration: %1", profile.name) << '\n';
    const QString answer = ask(i18n("Use this configuration? [Y/n]: "));
    if (answer.isNull()) return false;
    return answer.toLower() != QLatin1String("n");
}

std::optional<ConnectionProfile> ProfilePrompt::create() {
    ConnectionProfile p;
    m_out << '\n' << i18n("Create new configuration:") << '\n';
    for (;;) {
        p.name = askRequired(i18n("Configuration name: "), i18n("Name cannot be empty"));
        if (p.name.isNull()) return std::nullopt;
        if (isValidProfileName(p.name)) break;
        m_out << i18n("Name cannot be \"General\" or contain '/', '\\', '[' or ']'") << '\n';
    }

    m_out << '\n' << i18n("Enter SSH connection details:") << '\n';
    p.hostname = askRequired(i18n("Hostname/IP: "), i18n("Hostname cannot be empty"));
    if (p.hostname.isNull()) return std::nullopt;
    for (;;) {
        p.port = askRequired(i18n("Port [22]: "), QString(), QStringLiteral("22"));
        if (p.port.isNull()) return std::nullopt;
        if (p.portNumber() != 0) break;
        m_out << i18n("Port must be a number between 1 and 65535") << '\n';
    }
    p.username = askRequired(i18n("Username: "), i18n("Username cannot be empty"));
    if (p.username.isNull()) return std::nullopt;
    for (;;) {
        bool ok = false;
        QByteArray secret = m_readSecret(i18n("Password: "), &ok);
        if (!ok) return std::nullopt;
        if (!secret.isEmpty()) {
            p.password = QString::fromUtf8(secret);
            secureZero(secret);
            break;
        }
        m_out << i18n("Password cannot be empty") << '\n';
    }

    m_out << '\n' << i18n("Enter LUKS volume details:") << '\n';
    p.device = askRequired(i18n("Device (e.g. /dev/sdb1): "), i18n("Device cannot be empty"));
    if (p.device.isNull()) return std::nullopt;
    p.mapper = askRequired(i18n("Mapper name [encrypted_vault]: "), QString(), QStringLiteral("encrypted_vault"));
    if (p.mapper.isNull()) return std::nullopt;
    p.mountPoint = askRequired(i18n("Mount point [/mnt/encrypted]: "), QString(), QStringLiteral("/mnt/encrypted"));
    if (p.mountPoint.isNull()) return std::nullopt;

    if (!p.isComplete()) return std::nullopt;
    return p;
}
