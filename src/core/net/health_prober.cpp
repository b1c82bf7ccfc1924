#include "core/net/health_prober.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QTcpSocket>
#include <QThread>

#include <algorithm>

namespace md {

bool HealthProber::waitUntilReady(const QString& host,
                                  quint16 port,
                                  const QString& path,
                                  int timeoutMs)
{
    QElapsedTimer timer;
    timer.start();
    int attempts = 0;

    while (timer.elapsed() < timeoutMs) {
        const int remainingMs = static_cast<int>(timeoutMs - timer.elapsed());
        ++attempts;
        if (probeOnce(host, port, path, std::max(1, std::min(kAttemptTimeoutMs, remainingMs)))) {
            LOG_INFO(mdNet, "http://%s:%u%s ready after %lldms (%d attempt(s))",
                     qUtf8Printable(host), static_cast<unsigned>(port), qUtf8Printable(path),
                     timer.elapsed(), attempts);
            return true;
        }

        const qint64 leftMs = timeoutMs - timer.elapsed();
        if (leftMs <= 0) {
            break;
        }
        QThread::msleep(static_cast<unsigned long>(std::min<qint64>(kPollIntervalMs, leftMs)));
    }

    LOG_WARN(mdNet, "http://%s:%u%s not ready after %dms (%d attempt(s))",
             qUtf8Printable(host), static_cast<unsigned>(port), qUtf8Printable(path),
             timeoutMs, attempts);
    return false;
}

bool HealthProber::probeOnce(const QString& host,
                             quint16 port,
                             const QString& path,
                             int attemptTimeoutMs)
{
    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(attemptTimeoutMs)) {
        return false;
    }

    const QByteArray request = QStringLiteral("GET %1 HTTP/1.1\r\nHost: %2:%3\r\nConnection: close\r\n\r\n")
                                   .arg(path, host)
                                   .arg(port)
                                   .toLatin1();
    socket.write(request);
    if (!socket.waitForBytesWritten(attemptTimeoutMs)) {
        socket.abort();
        return false;
    }

    QByteArray response;
    while (!response.contains('\n') && response.size() < kMaxResponseBytes) {
        if (socket.bytesAvailable() <= 0 && !socket.waitForReadyRead(attemptTimeoutMs)) {
            break;
        }
        response.append(socket.read(kMaxResponseBytes - response.size()));
    }
    socket.abort();

    return isSuccessStatusLine(response);
}

bool HealthProber::isSuccessStatusLine(const QByteArray& response)
{
    const int lineEnd = response.indexOf('\n');
    const QByteArray statusLine = (lineEnd < 0 ? response : response.left(lineEnd)).trimmed();
    if (!statusLine.startsWith("HTTP/")) {
        return false;
    }
    const QList<QByteArray> parts = statusLine.split(' ');
    return parts.size() >= 2 && parts.at(1) == "200";
}

} // namespace md
