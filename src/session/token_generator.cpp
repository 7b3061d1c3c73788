#include "token_generator.h"
#include <QDateTime>
#include <QRandomGenerator>

QString TokenGenerator::next() {
    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    const qint64 noise = static_cast<qint64>(QRandomGenerator::system()->generate64());
    return QString::number(now ^ noise);
}
