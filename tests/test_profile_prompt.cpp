#include <doctest/doctest.h>

#include "ui/ProfilePrompt.h"

#include <QTextStream>

namespace {

// Feeds scripted answers to the prompt and collects what it prints.
struct PromptFixture {
    explicit PromptFixture(const QString &answers, QStringList secretAnswers = {})
        : input(answers), secrets(std::move(secretAnswers)), in(&input, QIODevice::ReadOnly), out(&output, QIODevice::WriteOnly),
          prompt(in, out, [this](const QString &, bool *ok) {
              if (secrets.isEmpty()) {
                  if (ok) *ok = false;
                  return QByteArray();
              }
              if (ok) *ok = true;
              return secrets.takeFirst().toUtf8();
          }) {}

    QString input;
    QString output;
    QStringList secrets;
    QTextStream in;
    QTextStream out;
    ProfilePrompt prompt;
};

QList<ConnectionProfile> savedProfiles() {
    ConnectionProfile a;
    a.name = QStringLiteral("home");
    a.hostname = QStringLiteral("203.0.113.5");
    a.port = QStringLiteral("2222");
    ConnectionProfile b;
    b.name = QStringLiteral("work");
    b.hostname = QStringLiteral("10.1.2.3");
    b.port = QStringLiteral("22");
    return {a, b};
}

}

TEST_CASE("ProfilePrompt select") {
    SUBCASE("Lists profiles and picks by number") {
        PromptFixture f(QStringLiteral("2\n"));
        const auto picked = f.prompt.select(savedProfiles());
        REQUIRE(picked.has_value());
        CHECK(picked->name == QStringLiteral("work"));
        f.out.flush();
        CHECK(f.output.contains(QLatin1String("1. home (203.0.113.5:2222)")));
        CHECK(f.output.contains(QLatin1String("2. work (10.1.2.3:22)")));
        CHECK(f.output.contains(QLatin1String("0. Create new configuration")));
    }

    SUBCASE("Zero and garbage mean create new") {
        PromptFixture zero(QStringLiteral("0\n"));
        CHECK_FALSE(zero.prompt.select(savedProfiles()).has_value());
        PromptFixture bad(QStringLiteral("abc\n"));
        CHECK_FALSE(bad.prompt.select(savedProfiles()).has_value());
        PromptFixture high(QStringLiteral("7\n"));
        CHECK_FALSE(high.prompt.select(savedProfiles()).has_value());
    }

    SUBCASE("Empty store asks nothing") {
        PromptFixture f{QString()};
        CHECK_FALSE(f.prompt.select({}).has_value());
        f.out.flush();
        CHECK(f.output.isEmpty());
    }

    SUBCASE("Confirmation defaults to yes") {
        PromptFixture yes(QStringLiteral("\n"));
        CHECK(yes.prompt.confirmUse(savedProfiles().at(0)));
        PromptFixture no(QStringLiteral("N\n"));
        CHECK_FALSE(no.prompt.confirmUse(savedProfiles().at(0)));
        PromptFixture eof{QString()};
        CHECK_FALSE(eof.prompt.confirmUse(savedProfiles().at(0)));
    }
}

TEST_CASE("ProfilePrompt create") {
    SUBCASE("Defaults fill port, mapper and mount point") {
        PromptFixture f(QStringLiteral("home\n203.0.113.5\n\nalice\n/dev/sdb1\n\n\n"), {QStringLiteral("s3cret")});
        const auto p = f.prompt.create();
        REQUIRE(p.has_value());
        CHECK(p->name == QStringLiteral("home"));
        CHECK(p->hostname == QStringLiteral("203.0.113.5"));
        CHECK(p->port == QStringLiteral("22"));
        CHECK(p->username == QStringLiteral("alice"));
        CHECK(p->password == QStringLiteral("s3cret"));
        CHECK(p->device == QStringLiteral("/dev/sdb1"));
        CHECK(p->mapper == QStringLiteral("encrypted_vault"));
        CHECK(p->mountPoint == QStringLiteral("/mnt/encrypted"));
    }

    SUBCASE("Empty required answers are asked again") {
        PromptFixture f(QStringLiteral("\nhome\n\n203.0.113.5\n2222\n\nalice\n\n/dev/sdb1\nvault1\n/mnt/vault\n"),
                        {QString(), QStringLiteral("s3cret")});
        const auto p = f.prompt.create();
        REQUIRE(p.has_value());
        CHECK(p->isComplete());
        CHECK(p->port == QStringLiteral("2222"));
        CHECK(p->mapper == QStringLiteral("vault1"));
        f.out.flush();
        CHECK(f.output.contains(QLatin1String("Name cannot be empty")));
        CHECK(f.output.contains(QLatin1String("Hostname cannot be empty")));
        CHECK(f.output.contains(QLatin1String("Username cannot be empty")));
        CHECK(f.output.contains(QLatin1String("Password cannot be empty")));
        CHECK(f.output.contains(QLatin1String("Device cannot be empty")));
    }

    SUBCASE("Bad port and reserved name are asked again") {
        PromptFixture f(QStringLiteral("General\nhome\nhost\n99999\n22\nalice\n/dev/sdb1\n\n\n"), {QStringLiteral("pw")});
        const auto p = f.prompt.create();
        REQUIRE(p.has_value());
        CHECK(p->name == QStringLiteral("home"));
        CHECK(p->port == QStringLiteral("22"));
    }

    SUBCASE("End of input aborts") {
        PromptFixture f(QStringLiteral("home\n203.0.113.5\n"));
        CHECK_FALSE(f.prompt.create().has_value());
        PromptFixture noSecret(QStringLiteral("home\nhost\n22\nalice\n"));
        CHECK_FALSE(noSecret.prompt.create().has_value());
    }
}
