#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <termios.h>
#include <unistd.h>

#if defined(__GLIBC__)
#include <string.h>
#else
static inline void explicit_bzero(void *s, size_t n) {
    volatile unsigned char *p = reinterpret_cast<volatile unsigned char*>(s);
    while (n--) *p++ = 0;
}
#endif

// Turns terminal echo off for its lifetime.
class ScopedEchoOff {
public:
    explicit ScopedEchoOff(int fd) : fd_(fd) {
        if (!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0) return;
        struct termios t = saved_;
        t.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        t.c_lflag |= ECHONL;
        active_ = (::tcsetattr(fd_, TCSAFLUSH, &t) == 0);
    }
    ~ScopedEchoOff() {
        if (active_) ::tcsetattr(fd_, TCSAFLUSH, &saved_);
    }
    bool ok() const { return active_; }
private:
    int fd_;
    struct termios saved_{};
    bool active_{false};
};

class SecurePasswordPrompt {
public:
    // Reads one line from fd with echo disabled. Returns an empty array on EOF
    // or empty input; *ok is false on EOF, read error or an interrupting signal.
    static QByteArray getSecurePassword(const QString &prompt, bool *ok = nullptr, int fd = STDIN_FILENO) {
        std::fputs(prompt.toLocal8Bit().constData(), stderr);
        std::fflush(stderr);
        ScopedEchoOff echoOff(fd);

        QVector<char> buffer;
        bool gotLine = false;
        bool interrupted = false;
        for (;;) {
            char c = 0;
            const ssize_t n = ::read(fd, &c, 1);
            if (n < 0 && errno == EINTR) { interrupted = true; break; }
            if (n <= 0) break;
            if (c == '\n') { gotLine = true; break; }
            if (c == '\r') continue;
            buffer.append(c);
            explicit_bzero(&c, sizeof c);
        }
        if (ok) *ok = !interrupted && (gotLine || !buffer.isEmpty());

        QByteArray password;
        if (!interrupted) password = QByteArray(buffer.constData(), buffer.size());
        if (!buffer.isEmpty()) {
            explicit_bzero(buffer.data(), static_cast<size_t>(buffer.size()));
            buffer.clear();
        }
        return password;
    }
};
