#include "line_codec.h"

Result<QList<MultiLinePacket>> LineCodec::decode(QByteArray& buffer) const {
    QList<MultiLinePacket> packets;
    QStringList pending;
    qsizetype packetStart = 0;
    qsizetype pos = 0;

    // Packets completed before a framing error are still handed out; the
    // error is reported by the next call, which starts at the bad packet.
    auto fail = [&](const DomainFailure& failure) -> Result<QList<MultiLinePacket>> {
        if (packets.isEmpty())
            return std::unexpected(failure);
        buffer.remove(0, packetStart);
        return packets;
    };

    while (true) {
        const qsizetype newline = buffer.indexOf('\n', pos);
        if (newline < 0) {
            // a trailing '\r' belongs to a line ending still in flight
            qsizetype tail = buffer.size() - pos;
            if (tail > 0 && buffer.endsWith('\r'))
                --tail;
            if (tail > m_maxLineLength) {
                return fail(DomainFailure::protocolError(
                    QStringLiteral("line_too_long"),
                    QStringLiteral("line exceeds %1 bytes").arg(m_maxLineLength)));
            }
            break;
        }

        QByteArray raw = buffer.mid(pos, newline - pos);
        pos = newline + 1;
        if (raw.endsWith('\r'))
            raw.chop(1);

        if (raw.size() > m_maxLineLength) {
            return fail(DomainFailure::protocolError(
                QStringLiteral("line_too_long"),
                QStringLiteral("line exceeds %1 bytes").arg(m_maxLineLength)));
        }

        if (raw.isEmpty()) {
            if (!pending.isEmpty()) {
                packets.append(MultiLinePacket(pending));
                pending.clear();
            }
            packetStart = pos;
            continue;
        }

        pending.append(QString::fromUtf8(raw));
        if (pending.size() > m_maxPacketLines) {
            return fail(DomainFailure::protocolError(
                QStringLiteral("packet_too_large"),
                QStringLiteral("packet exceeds %1 lines").arg(m_maxPacketLines)));
        }
    }

    buffer.remove(0, packetStart);
    return packets;
}

QByteArray LineCodec::encode(const MultiLinePacket& packet) {
    return encodeLines(packet.lines());
}

QByteArray LineCodec::encodeLines(const QStringList& lines) {
    QByteArray out;
    for (const QString& line : lines) {
        out.append(line.toUtf8());
        out.append('\n');
    }
    out.append('\n');
    return out;
}
