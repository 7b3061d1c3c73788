#pragma once
#include "filter.h"
#include <QList>
#include <memory>
#include <optional>
#include <vector>

struct ChainOutcome {
    std::optional<MultiLinePacket> delivered;  // set when the last filter forwarded
    QList<MultiLinePacket> outbound;           // ready for the transport, in order
};

// Filters are ordered from the transport (index 0) toward the application.
// Reads travel up the chain, writes travel down.
class FilterChain {
public:
    void addFilter(std::unique_ptr<IConnectionFilter> filter);
    int size() const { return static_cast<int>(m_filters.size()); }

    Result<ChainOutcome> processRead(ConnectionId connection, const MultiLinePacket& packet);
    Result<MultiLinePacket> processWrite(ConnectionId connection, const MultiLinePacket& packet);
    void processClose(ConnectionId connection);

private:
    Result<MultiLinePacket> writeFrom(int index, ConnectionId connection,
                                      MultiLinePacket packet);

    std::vector<std::unique_ptr<IConnectionFilter>> m_filters;
};
