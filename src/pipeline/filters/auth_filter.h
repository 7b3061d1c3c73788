#pragma once
#include "pipeline/filter.h"
#include "session/session_table.h"
#include "session/token_generator.h"
#include <memory>

// Per-connection handshake authentication.
//
// "authentication-request" mints a token, stores it against the connection
// and answers with "authentication-response" / "auth-id: <token>". Every other
// inbound packet must carry "auth-id: <token>" at line 1, which is checked and
// stripped. Outbound packets get the header inserted at line 1, except the
// authentication response itself.
class AuthFilter : public IConnectionFilter {
public:
    static const QString kRequestCommand;
    static const QString kResponseCommand;
    static const QString kHeaderKey;

    explicit AuthFilter(std::unique_ptr<TokenGenerator> tokens = std::make_unique<TokenGenerator>());

    QString name() const override { return "auth"; }
    Result<NextAction> onRead(FilterContext& ctx) override;
    Result<NextAction> onWrite(FilterContext& ctx) override;
    Result<NextAction> onClose(FilterContext& ctx) override;

    const SessionTable& sessions() const { return m_sessions; }

    static QString headerLine(const QString& token);

private:
    MultiLinePacket authenticate(ConnectionId connection);
    VoidResult checkAuth(ConnectionId connection, const QString& headerLine) const;

    SessionTable m_sessions;
    std::unique_ptr<TokenGenerator> m_tokens;
};
