#include <doctest/doctest.h>

#include "FakeRunner.h"
#include "Trust.h"

#include <QFile>
#include <QTemporaryDir>

TEST_CASE("Local tool checks") {
    FakeRunner runner;

    SUBCASE("Everything present") {
        runner.installed << QStringLiteral("sshpass") << QStringLiteral("ssh") << QStringLiteral("sshfs")
                         << QStringLiteral("fusermount") << QStringLiteral("umount");
        CHECK(checkLocalTools(runner, requiredLocalTools(), false).isEmpty());
    }

    SUBCASE("Either fusermount satisfies the requirement") {
        runner.installed << QStringLiteral("sshpass") << QStringLiteral("ssh") << QStringLiteral("sshfs")
                         << QStringLiteral("fusermount3") << QStringLiteral("umount");
        CHECK(checkLocalTools(runner, requiredLocalTools(), false).isEmpty());
    }

    SUBCASE("Missing tools are named and get install hints") {
        runner.installed << QStringLiteral("ssh") << QStringLiteral("umount") << QStringLiteral("fusermount");
        const QList<ToolProblem> problems = checkLocalTools(runner, requiredLocalTools(), false);
        REQUIRE(problems.size() == 2);
        CHECK(problems.at(0).tool == QStringLiteral("sshpass"));
        CHECK(problems.at(1).tool == QStringLiteral("sshfs"));
        CHECK(problems.at(0).reason == QStringLiteral("not found"));
        CHECK(installHints(problems).size() == 3);
    }

    SUBCASE("Untrusted location is reported") {
        QTemporaryDir dir;
        REQUIRE(dir.isValid());
        const QString fake = dir.filePath(QStringLiteral("sshfs"));
        QFile f(fake);
        REQUIRE(f.open(QIODevice::WriteOnly));
        f.write("#!/bin/sh\n");
        f.close();
        REQUIRE(f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner));
        QString reason;
        CHECK_FALSE(isExecutableTrustedDetailed(fake, &reason));
        CHECK(reason == QStringLiteral("outside trusted prefix"));
        CHECK_FALSE(isExecutableTrustedDetailed(dir.filePath(QStringLiteral("nope")), &reason));
        CHECK(reason == QStringLiteral("not found"));
    }
}
