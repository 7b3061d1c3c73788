#include "failure.h"

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Protocol:       return QStringLiteral("protocol");
    case ErrorKind::Authentication: return QStringLiteral("authentication");
    case ErrorKind::InvalidInput:   return QStringLiteral("invalid_input");
    case ErrorKind::Internal:
    default:                        return QStringLiteral("internal");
    }
}

QString DomainFailure::describe() const {
    return QStringLiteral("%1/%2: %3").arg(errorKindName(kind), code, message);
}

QStringList DomainFailure::toLines() const {
    return {QStringLiteral("error"), QStringLiteral("%1: %2").arg(code, message)};
}

DomainFailure DomainFailure::protocolError(const QString& code, const QString& msg) {
    return {ErrorKind::Protocol, code, msg};
}

DomainFailure DomainFailure::authenticationError(const QString& msg) {
    return {ErrorKind::Authentication, "not_authenticated", msg};
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg};
}
