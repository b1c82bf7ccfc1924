#include "core/net/port_allocator.h"
#include "core/shared/logging.h"

#include <QHostAddress>
#include <QTcpServer>

namespace md {

quint16 PortAllocator::allocate()
{
    QTcpServer listener;
    if (!listener.listen(QHostAddress::LocalHost, 0)) {
        LOG_WARN(mdNet, "Failed to bind an ephemeral port (%s), using fallback %u",
                 qUtf8Printable(listener.errorString()),
                 static_cast<unsigned>(kFallbackPort));
        return kFallbackPort;
    }

    const quint16 port = listener.serverPort();
    listener.close();

    if (port == 0) {
        LOG_WARN(mdNet, "OS reported port 0, using fallback %u",
                 static_cast<unsigned>(kFallbackPort));
        return kFallbackPort;
    }

    LOG_DEBUG(mdNet, "Allocated port %u", static_cast<unsigned>(port));
    return port;
}

} // namespace md
