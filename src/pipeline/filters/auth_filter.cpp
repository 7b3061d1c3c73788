#include "auth_filter.h"
#include "core/log_manager.h"

const QString AuthFilter::kRequestCommand = QStringLiteral("authentication-request");
const QString AuthFilter::kResponseCommand = QStringLiteral("authentication-response");
const QString AuthFilter::kHeaderKey = QStringLiteral("auth-id");

AuthFilter::AuthFilter(std::unique_ptr<TokenGenerator> tokens)
    : m_tokens(std::move(tokens))
{
}

QString AuthFilter::headerLine(const QString& token) {
    return kHeaderKey + QStringLiteral(": ") + token;
}

Result<NextAction> AuthFilter::onRead(FilterContext& ctx) {
    const ConnectionId connection = ctx.connection();
    const MultiLinePacket& packet = ctx.message();

    if (packet.command().startsWith(kRequestCommand)) {
        ctx.write(authenticate(connection));
        return ctx.stop();
    }

    const auto idLine = packet.lineAt(1);
    if (!idLine) {
        return std::unexpected(DomainFailure::protocolError(
            QStringLiteral("missing_auth_header"),
            QStringLiteral("expected auth header at line 1")));
    }

    auto checked = checkAuth(connection, *idLine);
    if (!checked) return std::unexpected(checked.error());

    ctx.setMessage(packet.withLineRemoved(1));
    return ctx.invoke();
}

Result<NextAction> AuthFilter::onWrite(FilterContext& ctx) {
    const MultiLinePacket& packet = ctx.message();
    if (packet.command() == kResponseCommand) {
        return ctx.invoke();
    }

    const auto token = m_sessions.get(ctx.connection());
    if (!token) {
        return std::unexpected(DomainFailure::authenticationError(
            QStringLiteral("client is not authenticated")));
    }

    ctx.setMessage(packet.withLineInserted(1, headerLine(*token)));
    return ctx.invoke();
}

Result<NextAction> AuthFilter::onClose(FilterContext& ctx) {
    if (m_sessions.remove(ctx.connection())) {
        LOG_DEBUG(QStringLiteral("AuthFilter: session of connection %1 dropped")
                      .arg(ctx.connection()));
    }
    return ctx.invoke();
}

MultiLinePacket AuthFilter::authenticate(ConnectionId connection) {
    const QString token = m_tokens->next();
    m_sessions.put(connection, token);
    LOG_DEBUG(QStringLiteral("AuthFilter: connection %1 authenticated").arg(connection));

    return MultiLinePacket::of({kResponseCommand, headerLine(token)});
}

VoidResult AuthFilter::checkAuth(ConnectionId connection, const QString& idLine) const {
    const auto registered = m_sessions.get(connection);
    if (!registered) {
        return std::unexpected(DomainFailure::authenticationError(
            QStringLiteral("client is not authenticated")));
    }

    const QString prefix = kHeaderKey + QLatin1Char(':');
    if (!idLine.startsWith(prefix)) {
        return std::unexpected(DomainFailure::authenticationError(
            QStringLiteral("auth header missing")));
    }

    // Tokens never contain ':', so everything after the first colon is the id
    const QString id = idLine.section(QLatin1Char(':'), 1, 1).trimmed();
    if (id != *registered) {
        return std::unexpected(DomainFailure::authenticationError(
            QStringLiteral("auth id mismatch")));
    }
    return {};
}
