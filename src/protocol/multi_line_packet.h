#pragma once
#include <QString>
#include <QStringList>
#include <optional>

// An ordered sequence of text lines. Line 0 is the command marker.
// Packets are values: the with*() helpers return modified copies.
class MultiLinePacket {
public:
    MultiLinePacket() = default;
    explicit MultiLinePacket(QStringList lines) : m_lines(std::move(lines)) {}

    static MultiLinePacket of(std::initializer_list<QString> lines) {
        return MultiLinePacket(QStringList(lines));
    }

    const QStringList& lines() const { return m_lines; }
    int lineCount() const { return static_cast<int>(m_lines.size()); }
    bool isEmpty() const { return m_lines.isEmpty(); }

    QString command() const;
    std::optional<QString> lineAt(int index) const;

    MultiLinePacket withLineInserted(int index, const QString& line) const;
    MultiLinePacket withLineRemoved(int index) const;

    bool operator==(const MultiLinePacket& other) const { return m_lines == other.m_lines; }
    bool operator!=(const MultiLinePacket& other) const { return !(*this == other); }

private:
    QStringList m_lines;
};
