#pragma once
#include "multi_line_packet.h"
#include "result.h"
#include <QByteArray>
#include <QList>

// Frames packets as '\n'-terminated lines closed by an empty line.
class LineCodec {
public:
    explicit LineCodec(int maxLineLength = 4096, int maxPacketLines = 256)
        : m_maxLineLength(maxLineLength), m_maxPacketLines(maxPacketLines) {}

    // Consumes every complete packet at the front of `buffer`. Bytes of an
    // unfinished packet are left in place for the next call. A framing error
    // is returned only once no complete packet precedes it.
    Result<QList<MultiLinePacket>> decode(QByteArray& buffer) const;

    static QByteArray encode(const MultiLinePacket& packet);
    static QByteArray encodeLines(const QStringList& lines);

    int maxLineLength() const { return m_maxLineLength; }
    int maxPacketLines() const { return m_maxPacketLines; }

private:
    int m_maxLineLength;
    int m_maxPacketLines;
};
