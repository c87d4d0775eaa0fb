#pragma once

#include <QString>

class ReachabilityProbe {
public:
    virtual ~ReachabilityProbe() = default;
    virtual bool isReachable(const QString &host, quint16 port, int timeoutMs) = 0;
};

// Plain TCP connect attempt. Only a fast pre-check before ssh authentication.
class TcpProbe : public ReachabilityProbe {
public:
    bool isReachable(const QString &host, quint16 port, int timeoutMs = 5000) override;
};
