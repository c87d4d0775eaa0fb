#include <doctest/doctest.h>

#include "IdleHold.h"

#include <QEventLoop>
#include <QTimer>
#include <csignal>
#include <cstring>
#include <unistd.h>

TEST_CASE("IdleHold") {
    SUBCASE("Wait returns the first trigger reason") {
        IdleHold hold;
        QTimer::singleShot(10, &hold, [&hold] { hold.trigger(QStringLiteral("SIGTERM")); });
        QTimer::singleShot(20, &hold, [&hold] { hold.trigger(QStringLiteral("continue")); });
        CHECK(hold.wait() == QStringLiteral("SIGTERM"));
        CHECK(hold.isTriggered());
    }

    SUBCASE("A trigger before wait returns at once") {
        IdleHold hold;
        hold.trigger(QStringLiteral("suspend"));
        hold.trigger(QStringLiteral("continue"));
        CHECK(hold.wait() == QStringLiteral("suspend"));
        CHECK(hold.reason() == QStringLiteral("suspend"));
    }

    SUBCASE("Signals are delivered through the event loop") {
        IdleHold hold;
        REQUIRE(hold.watchSignals());
        QTimer::singleShot(10, &hold, [] { ::raise(SIGHUP); });
        CHECK(hold.wait() == QStringLiteral("SIGHUP"));
    }
}

TEST_CASE("IdleHold signal poll") {
    SUBCASE("A signal raised outside the event loop is seen by poll") {
        IdleHold hold;
        REQUIRE(hold.watchSignals());
        CHECK_FALSE(hold.poll());
        ::raise(SIGINT);
        CHECK(hold.poll());
        CHECK(hold.reason() == QStringLiteral("SIGINT"));
        CHECK(hold.wait() == QStringLiteral("SIGINT"));
    }

    SUBCASE("poll without watched signals only reports earlier triggers") {
        IdleHold hold;
        CHECK_FALSE(hold.poll());
        hold.trigger(QStringLiteral("suspend"));
        CHECK(hold.poll());
    }
}

namespace {

// Runs the event loop for a short while without waiting for a trigger.
void spinEvents(int ms) {
    QEventLoop loop;
    QTimer::singleShot(ms, &loop, &QEventLoop::quit);
    loop.exec();
}

struct Pipe {
    Pipe() { ok = ::pipe(fds) == 0; }
    ~Pipe() {
        closeWrite();
        if (fds[0] >= 0) ::close(fds[0]);
    }
    void closeWrite() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
    bool send(const char *text) { return ::write(fds[1], text, std::strlen(text)) == static_cast<ssize_t>(std::strlen(text)); }

    int fds[2] = {-1, -1};
    bool ok = false;
};

}

TEST_CASE("IdleHold stdin") {
    Pipe pipe;
    REQUIRE(pipe.ok);
    IdleHold hold;
    REQUIRE(hold.watchStdin(pipe.fds[0]));

    SUBCASE("A newline continues") {
        REQUIRE(pipe.send("\n"));
        CHECK(hold.wait() == QStringLiteral("continue"));
    }

    SUBCASE("Text without a newline does not trigger") {
        REQUIRE(pipe.send("abc"));
        spinEvents(50);
        CHECK_FALSE(hold.isTriggered());
        REQUIRE(pipe.send("def\n"));
        CHECK(hold.wait() == QStringLiteral("continue"));
    }

    SUBCASE("End of input triggers the unwind") {
        REQUIRE(pipe.send("partial"));
        pipe.closeWrite();
        CHECK(hold.wait() == QStringLiteral("stdin closed"));
    }
}
