#include "http_stub_server.h"

#include <QElapsedTimer>
#include <QHostAddress>
#include <QMutexLocker>
#include <QTcpServer>
#include <QTcpSocket>

#include <memory>

namespace md::test {

HttpStubServer::HttpStubServer(quint16 port, int listenDelayMs, QByteArray statusLine)
    : m_port(port)
    , m_listenDelayMs(listenDelayMs)
    , m_statusLine(std::move(statusLine))
{
}

HttpStubServer::~HttpStubServer()
{
    stop();
}

void HttpStubServer::stop()
{
    m_stop.store(true);
    wait();
}

QByteArray HttpStubServer::lastRequestLine() const
{
    QMutexLocker lock(&m_mutex);
    return m_lastRequestLine;
}

void HttpStubServer::run()
{
    QElapsedTimer delay;
    delay.start();
    while (!m_stop.load() && delay.elapsed() < m_listenDelayMs) {
        QThread::msleep(10);
    }
    if (m_stop.load()) {
        return;
    }

    QTcpServer server;
    if (!server.listen(QHostAddress::LocalHost, m_port)) {
        m_listenFailed.store(true);
        return;
    }

    while (!m_stop.load()) {
        if (!server.waitForNewConnection(50)) {
            continue;
        }
        std::unique_ptr<QTcpSocket> socket(server.nextPendingConnection());
        if (!socket) {
            continue;
        }

        QByteArray request;
        while (!request.contains("\r\n\r\n") && socket->waitForReadyRead(500)) {
            request += socket->readAll();
        }
        {
            QMutexLocker lock(&m_mutex);
            m_lastRequestLine = request.left(request.indexOf("\r\n"));
        }
        m_requestCount.fetch_add(1);

        socket->write(m_statusLine
                      + "\r\nContent-Type: application/json\r\n"
                        "Content-Length: 2\r\nConnection: close\r\n\r\n[]");
        socket->waitForBytesWritten(500);
        socket->disconnectFromHost();
        if (socket->state() != QAbstractSocket::UnconnectedState) {
            socket->waitForDisconnected(500);
        }
    }
}

} // namespace md::test
