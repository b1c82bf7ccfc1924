#include "core/ipc/service_state.h"

namespace md {

bool ServiceState::assignPort(quint16 port)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_port) {
        return false;
    }
    m_port = port;
    return true;
}

std::optional<quint16> ServiceState::port() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_port;
}

ProcessHandle ServiceState::storeServer(ProcessHandle server)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdownRequested) {
        return server;
    }
    m_server = std::move(server);
    return nullptr;
}

ProcessHandle ServiceState::storeWorker(ProcessHandle worker)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_shutdownRequested) {
        return worker;
    }
    m_worker = std::move(worker);
    return nullptr;
}

ProcessHandle ServiceState::takeServer()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::move(m_server);
}

ProcessHandle ServiceState::takeWorker()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::move(m_worker);
}

ServiceState::Handles ServiceState::takeAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Handles handles;
    handles.server = std::move(m_server);
    handles.worker = std::move(m_worker);
    return handles;
}

bool ServiceState::hasServer() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_server != nullptr;
}

bool ServiceState::hasWorker() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_worker != nullptr;
}

void ServiceState::requestShutdown()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdownRequested = true;
}

bool ServiceState::shutdownRequested() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdownRequested;
}

} // namespace md
