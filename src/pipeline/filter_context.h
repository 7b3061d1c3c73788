#pragma once
#include "protocol/multi_line_packet.h"
#include "protocol/types.h"
#include <QList>

// Per-invocation state handed to a filter hook.
class FilterContext {
public:
    FilterContext(ConnectionId connection, MultiLinePacket message)
        : m_connection(connection), m_message(std::move(message)) {}

    ConnectionId connection() const { return m_connection; }
    const MultiLinePacket& message() const { return m_message; }
    void setMessage(MultiLinePacket message) { m_message = std::move(message); }

    // Enqueues an outbound packet on the same connection. The chain sends it
    // toward the transport once the current hook returns.
    void write(MultiLinePacket packet) { m_writes.append(std::move(packet)); }
    QList<MultiLinePacket> takeWrites();

    NextAction stop() const { return NextAction::Stop; }
    NextAction invoke() const { return NextAction::Invoke; }

private:
    ConnectionId m_connection;
    MultiLinePacket m_message;
    QList<MultiLinePacket> m_writes;
};
