#pragma once
#include "protocol/types.h"
#include <QHash>
#include <QReadWriteLock>
#include <QString>
#include <array>
#include <optional>

// Connection id -> session token. Entries are spread over independently
// locked shards so unrelated connections do not serialize on one lock.
class SessionTable {
public:
    SessionTable() = default;
    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;

    void put(ConnectionId connection, const QString& token);
    std::optional<QString> get(ConnectionId connection) const;
    bool remove(ConnectionId connection);
    bool contains(ConnectionId connection) const;
    int size() const;
    void clear();

    static constexpr int kShardCount = 16;

private:
    struct Shard {
        mutable QReadWriteLock lock;
        QHash<ConnectionId, QString> tokens;
    };

    Shard& shardFor(ConnectionId connection);
    const Shard& shardFor(ConnectionId connection) const;

    std::array<Shard, kShardCount> m_shards;
};
