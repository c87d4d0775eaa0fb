#include <doctest/doctest.h>

#include "FakeRunner.h"
#include "LocalBridge.h"

#include <unistd.h>

namespace {

ConnectionProfile bridgeProfile() {
    ConnectionProfile p;
    p.name = QStringLiteral("lab");
    p.hostname = QStringLiteral("vault.example.org");
    p.port = QStringLiteral("2200");
    p.username = QStringLiteral("bob");
    p.password = QStringLiteral("hunter2");
    p.device = QStringLiteral("/dev/vdb");
    p.mapper = QStringLiteral("labvault");
    p.mountPoint = QStringLiteral("/srv/vault");
    return p;
}

}

TEST_CASE("LocalBridge mount") {
    VaultSettings settings;
    FakeRunner runner;
    LocalBridge bridge(runner, settings);

    SUBCASE("Password goes to stdin, never to argv") {
        const ProcessResult r = bridge.mount(bridgeProfile(), QStringLiteral("/home/bob/.LUKS-VAULT/mnt"));
        CHECK(r.ok());
        REQUIRE(runner.requests.size() == 1);
        const ProcessRequest &req = runner.requests.at(0);
        CHECK(req.program == QStringLiteral("sshfs"));
        CHECK(req.input == QByteArrayLiteral("hunter2\n"));
        CHECK(req.arguments.contains(QStringLiteral("password_stdin")));
        CHECK_FALSE(req.arguments.join(QLatin1Char(' ')).contains(QLatin1String("hunter2")));
        CHECK(req.timeoutMs == settings.bridgeTimeoutSec * 1000);
    }

    SUBCASE("Arguments carry port, keepalive and ownership") {
        const QStringList args = bridge.mountArguments(bridgeProfile(), QStringLiteral("/tmp/m"));
        CHECK(args.at(0) == QStringLiteral("-p"));
        CHECK(args.at(1) == QStringLiteral("2200"));
        CHECK(args.contains(QStringLiteral("reconnect")));
        CHECK(args.contains(QStringLiteral("ServerAliveInterval=20")));
        CHECK(args.contains(QStringLiteral("ServerAliveCountMax=5")));
        CHECK(args.contains(QStringLiteral("allow_other")));
        CHECK(args.contains(QStringLiteral("uid=%1").arg(getuid())));
        CHECK(args.contains(QStringLiteral("gid=%1").arg(getgid())));
        CHECK(args.at(args.size() - 2) == QStringLiteral("bob@vault.example.org:/srv/vault"));
        CHECK(args.last() == QStringLiteral("/tmp/m"));
    }

    SUBCASE("IPv6 literal is bracketed") {
        ConnectionProfile p = bridgeProfile();
        p.hostname = QStringLiteral("2001:db8::7");
        const QStringList args = bridge.mountArguments(p, QStringLiteral("/tmp/m"));
        CHECK(args.at(args.size() - 2) == QStringLiteral("bob@[2001:db8::7]:/srv/vault"));
    }
}

TEST_CASE("LocalBridge unmount") {
    VaultSettings settings;
    FakeRunner runner;
    LocalBridge bridge(runner, settings);

    SUBCASE("Strategies come in a fixed order") {
        const QList<UnmountStrategy> s = bridge.unmountStrategies(QStringLiteral("/tmp/m"));
        REQUIRE(s.size() == 4);
        CHECK(s.at(0).program == QStringLiteral("fusermount"));
        CHECK(s.at(0).arguments == QStringList{QStringLiteral("-u"), QStringLiteral("/tmp/m")});
        CHECK(s.at(1).program == QStringLiteral("umount"));
        CHECK(s.at(1).arguments == QStringList{QStringLiteral("-l"), QStringLiteral("/tmp/m")});
        CHECK(s.at(2).program == QStringLiteral("sudo"));
        CHECK(s.at(3).arguments == QStringList{QStringLiteral("-n"), QStringLiteral("umount"), QStringLiteral("/tmp/m")});
    }

    SUBCASE("fusermount3 is preferred when present") {
        runner.installed << QStringLiteral("fusermount3");
        const QList<UnmountStrategy> s = bridge.unmountStrategies(QStringLiteral("/tmp/m"));
        CHECK(s.at(0).program == QStringLiteral("/usr/bin/fusermount3"));
    }

    SUBCASE("Stops at the first strategy that works") {
        runner.responder = [](const ProcessRequest &r) {
            return r.program == QLatin1String("umount") ? fakeResult(0) : fakeResult(1, QString(), QStringLiteral("busy"));
        };
        QString used;
        CHECK(bridge.unmount(QStringLiteral("/tmp/m"), &used));
        CHECK(used == QStringLiteral("umount -l"));
        CHECK(runner.requests.size() == 2);
    }

    SUBCASE("Reports the last error when nothing works") {
        runner.responder = [](const ProcessRequest &) { return fakeResult(1, QString(), QStringLiteral("not mounted\n")); };
        QString used;
        QString err;
        CHECK_FALSE(bridge.unmount(QStringLiteral("/tmp/m"), &used, &err));
        CHECK(used.isEmpty());
        CHECK(err == QStringLiteral("not mounted"));
        CHECK(runner.requests.size() == 4);
    }
}
