#include "multi_line_packet.h"

QString MultiLinePacket::command() const {
    return m_lines.isEmpty() ? QString() : m_lines.first();
}

std::optional<QString> MultiLinePacket::lineAt(int index) const {
    if (index < 0 || index >= m_lines.size())
        return std::nullopt;
    return m_lines.at(index);
}

MultiLinePacket MultiLinePacket::withLineInserted(int index, const QString& line) const {
    QStringList lines = m_lines;
    lines.insert(qBound(qsizetype(0), qsizetype(index), lines.size()), line);
    return MultiLinePacket(std::move(lines));
}

MultiLinePacket MultiLinePacket::withLineRemoved(int index) const {
    if (index < 0 || index >= m_lines.size())
        return *this;
    QStringList lines = m_lines;
    lines.removeAt(index);
    return MultiLinePacket(std::move(lines));
}
