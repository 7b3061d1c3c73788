#include "filter_context.h"

QList<MultiLinePacket> FilterContext::takeWrites() {
    QList<MultiLinePacket> writes;
    writes.swap(m_writes);
    return writes;
}
