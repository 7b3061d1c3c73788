#include "session_table.h"
#include <QReadLocker>
#include <QWriteLocker>

SessionTable::Shard& SessionTable::shardFor(ConnectionId connection) {
    return m_shards[qHash(connection) % kShardCount];
}

const SessionTable::Shard& SessionTable::shardFor(ConnectionId connection) const {
    return m_shards[qHash(connection) % kShardCount];
}

void SessionTable::put(ConnectionId connection, const QString& token) {
    Shard& shard = shardFor(connection);
    QWriteLocker locker(&shard.lock);
    shard.tokens.insert(connection, token);
}

std::optional<QString> SessionTable::get(ConnectionId connection) const {
    const Shard& shard = shardFor(connection);
    QReadLocker locker(&shard.lock);
    auto it = shard.tokens.constFind(connection);
    if (it == shard.tokens.cend())
        return std::nullopt;
    return it.value();
}

bool SessionTable::remove(ConnectionId connection) {
    Shard& shard = shardFor(connection);
    QWriteLocker locker(&shard.lock);
    return shard.tokens.remove(connection);
}

bool SessionTable::contains(ConnectionId connection) const {
    const Shard& shard = shardFor(connection);
    QReadLocker locker(&shard.lock);
    return shard.tokens.contains(connection);
}

int SessionTable::size() const {
    int total = 0;
    for (const Shard& shard : m_shards) {
        QReadLocker locker(&shard.lock);
        total += static_cast<int>(shard.tokens.size());
    }
    return total;
}

void SessionTable::clear() {
    for (Shard& shard : m_shards) {
        QWriteLocker locker(&shard.lock);
        shard.tokens.clear();
    }
}
