#pragma once

#include <QtGlobal>

namespace md {

// Picks an ephemeral TCP port on the loopback interface.
//
// The port is free when allocate() returns, nothing more: the server that
// later binds it may still lose a race with another process.
class PortAllocator {
public:
    static constexpr quint16 kFallbackPort = 3210;

    // Never fails. Returns kFallbackPort if no port could be obtained.
    static quint16 allocate();
};

} // namespace md
