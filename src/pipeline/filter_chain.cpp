#include "filter_chain.h"
#include "core/log_manager.h"

void FilterChain::addFilter(std::unique_ptr<IConnectionFilter> filter) {
    m_filters.push_back(std::move(filter));
}

namespace {

DomainFailure emptyPacket() {
    return DomainFailure::protocolError(
        QStringLiteral("empty_packet"), QStringLiteral("packet has no lines"));
}

}

Result<ChainOutcome> FilterChain::processRead(ConnectionId connection,
                                              const MultiLinePacket& packet) {
    if (packet.isEmpty())
        return std::unexpected(emptyPacket());

    ChainOutcome outcome;
    FilterContext ctx(connection, packet);

    for (int i = 0; i < size(); ++i) {
        auto action = m_filters[i]->onRead(ctx);
        if (!action) return std::unexpected(action.error());

        // Writes issued by filter i only pass the filters below it
        for (auto& pending : ctx.takeWrites()) {
            auto written = writeFrom(i - 1, connection, std::move(pending));
            if (!written) return std::unexpected(written.error());
            outcome.outbound.append(*written);
        }

        if (*action == NextAction::Stop)
            return outcome;
    }

    outcome.delivered = ctx.message();
    return outcome;
}

Result<MultiLinePacket> FilterChain::processWrite(ConnectionId connection,
                                                  const MultiLinePacket& packet) {
    if (packet.isEmpty())
        return std::unexpected(emptyPacket());
    return writeFrom(size() - 1, connection, packet);
}

Result<MultiLinePacket> FilterChain::writeFrom(int index, ConnectionId connection,
                                               MultiLinePacket packet) {
    FilterContext ctx(connection, std::move(packet));
    for (int i = index; i >= 0; --i) {
        auto action = m_filters[i]->onWrite(ctx);
        if (!action) return std::unexpected(action.error());
        if (*action == NextAction::Stop) {
            return std::unexpected(DomainFailure::internal(
                QStringLiteral("filter '%1' stopped an outbound packet")
                    .arg(m_filters[i]->name())));
        }
    }
    return ctx.message();
}

void FilterChain::processClose(ConnectionId connection) {
    FilterContext ctx(connection, MultiLinePacket());
    for (int i = size() - 1; i >= 0; --i) {
        auto action = m_filters[i]->onClose(ctx);
        if (!action) {
            LOG_WARNING(QStringLiteral("FilterChain: close hook of '%1' failed for connection %2: %3")
                            .arg(m_filters[i]->name())
                            .arg(connection)
                            .arg(action.error().describe()));
        }
    }
}
