#pragma once

#include <QByteArray>
#include <QString>

namespace md {

// HealthProber -- blocking readiness poll against a local HTTP endpoint.
//
// Each attempt opens a fresh connection, sends a minimal GET and checks the
// status line for 200. Attempts are spaced kPollIntervalMs apart until the
// deadline passes. There is no way to cancel a running poll.
class HealthProber {
public:
    static constexpr int kAttemptTimeoutMs = 250;
    static constexpr int kPollIntervalMs = 150;
    static constexpr int kMaxResponseBytes = 512;

    static bool waitUntilReady(const QString& host,
                               quint16 port,
                               const QString& path,
                               int timeoutMs);

    // One connect/request/response round trip. `attemptTimeoutMs` bounds each
    // of connect, write and read.
    static bool probeOnce(const QString& host,
                          quint16 port,
                          const QString& path,
                          int attemptTimeoutMs = kAttemptTimeoutMs);

    static bool isSuccessStatusLine(const QByteArray& response);
};

} // namespace md
