#pragma once

#include <QProcess>

#include <memory>
#include <mutex>
#include <optional>

namespace md {

using ProcessHandle = std::unique_ptr<QProcess>;

// ServiceState -- the launcher's only shared mutable state.
//
// Every field is guarded by one mutex because shutdown may arrive while
// startup is still running. Handles are exclusively owned: taking one leaves
// the slot empty, so a process is never killed twice.
class ServiceState {
public:
    struct Handles {
        ProcessHandle server;
        ProcessHandle worker;
    };

    ServiceState() = default;
    ServiceState(const ServiceState&) = delete;
    ServiceState& operator=(const ServiceState&) = delete;

    // The port is set once per run. Returns false if it was already set.
    bool assignPort(quint16 port);
    std::optional<quint16> port() const;

    // Stores the handle unless shutdown was requested, in which case the
    // handle is handed back for the caller to dispose of.
    ProcessHandle storeServer(ProcessHandle server);
    ProcessHandle storeWorker(ProcessHandle worker);

    ProcessHandle takeServer();
    ProcessHandle takeWorker();
    Handles takeAll();

    bool hasServer() const;
    bool hasWorker() const;

    void requestShutdown();
    bool shutdownRequested() const;

private:
    mutable std::mutex m_mutex;
    std::optional<quint16> m_port;
    ProcessHandle m_server;
    ProcessHandle m_worker;
    bool m_shutdownRequested = false;
};

} // namespace md
