#pragma once
#include "types.h"
#include <QString>
#include <QStringList>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;

    QString describe() const;
    QStringList toLines() const;

    static DomainFailure protocolError(const QString& code, const QString& msg);
    static DomainFailure authenticationError(const QString& msg);
    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure internal(const QString& msg);
};

QString errorKindName(ErrorKind kind);
