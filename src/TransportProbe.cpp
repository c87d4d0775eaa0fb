#include "TransportProbe.h"

#include "Log.h"

#include <QTcpSocket>

bool TcpProbe::isReachable(const QString &host, quint16 port, int timeoutMs) {
    if (host.isEmpty() || port == 0) return false;
    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(timeoutMs)) {
        logEvent(QStringLiteral("probe_failed: %1:%2 %3").arg(host).arg(port).arg(socket.errorString()));
        socket.abort();
        return false;
    }
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState) socket.waitForDisconnected(1000);
    return true;
}
