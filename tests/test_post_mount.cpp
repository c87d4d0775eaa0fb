#include <doctest/doctest.h>

#include "FakeRunner.h"
#include "PostMountAction.h"

TEST_CASE("PostMountAction") {
    FakeRunner runner;
    PostMountAction action(runner);

    SUBCASE("Nothing is launched without a display") {
        runner.installed << QStringLiteral("thunar");
        CHECK(action.launch(QStringLiteral("/tmp/m"), false).isEmpty());
        CHECK(runner.detached.isEmpty());
    }

    SUBCASE("First installed candidate wins") {
        runner.installed << QStringLiteral("nemo") << QStringLiteral("nautilus");
        CHECK(action.launch(QStringLiteral("/tmp/m"), true) == QStringLiteral("Nautilus (GNOME)"));
        CHECK(runner.detached == QStringList{QStringLiteral("/usr/bin/nautilus /tmp/m")});
    }

    SUBCASE("Falls through when a launch fails") {
        runner.installed << QStringLiteral("thunar") << QStringLiteral("pcmanfm");
        runner.failDetached << QStringLiteral("/usr/bin/thunar");
        CHECK(action.launch(QStringLiteral("/tmp/m"), true) == QStringLiteral("PCManFM (LXDE)"));
        CHECK(runner.detached.size() == 2);
    }

    SUBCASE("No file manager installed") {
        CHECK(action.launch(QStringLiteral("/tmp/m"), true).isEmpty());
        CHECK(runner.detached.isEmpty());
    }

    SUBCASE("Display detection") {
        QProcessEnvironment env;
        CHECK_FALSE(PostMountAction::hasGraphicalDisplay(env));
        env.insert(QStringLiteral("WAYLAND_DISPLAY"), QStringLiteral("wayland-0"));
        CHECK(PostMountAction::hasGraphicalDisplay(env));
        QProcessEnvironment x11;
        x11.insert(QStringLiteral("DISPLAY"), QStringLiteral(":0"));
        CHECK(PostMountAction::hasGraphicalDisplay(x11));
    }

    SUBCASE("Candidate order") {
        const QList<FileManager> &c = PostMountAction::candidates();
        REQUIRE(c.size() == 5);
        CHECK(c.at(0).executable == QStringLiteral("thunar"));
        CHECK(c.at(1).executable == QStringLiteral("dolphin"));
        CHECK(c.at(2).executable == QStringLiteral("nautilus"));
        CHECK(c.at(3).executable == QStringLiteral("pcmanfm"));
        CHECK(c.at(4).executable == QStringLiteral("nemo"));
    }
}
