#pragma once

#include <QDateTime>
#include <QHash>
#include <QString>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace marketbrief {

//! Thread-safe key -> value store with per-entry expiry. Last writer wins.
template <typename Value>
class TtlCache {
public:
    using Clock = std::function<qint64()>;

    explicit TtlCache(std::chrono::seconds defaultTtl = std::chrono::seconds(3600))
        : m_defaultTtl(defaultTtl)
        , m_clock([] { return QDateTime::currentMSecsSinceEpoch(); })
    {
    }

    std::optional<Value> get(const QString& key) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd()) {
            return std::nullopt;
        }
        if (it->expiresAtMs <= m_clock()) {
            return std::nullopt;
        }
        return it->value;
    }

    void put(const QString& key, Value value)
    {
        put(key, std::move(value), m_defaultTtl);
    }

    void put(const QString& key, Value value, std::chrono::seconds ttl)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const qint64 now = m_clock();
        Entry entry{std::move(value), now + static_cast<qint64>(ttl.count()) * 1000};
        m_entries.insert(key, std::move(entry));
        pruneLocked(now);
    }

    void remove(const QString& key)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.remove(key);
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }

    int size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<int>(m_entries.size());
    }

    std::chrono::seconds defaultTtl() const { return m_defaultTtl; }

    void setClockForTesting(Clock clock)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (clock) {
            m_clock = std::move(clock);
        }
    }

private:
    struct Entry {
        Value  value;
        qint64 expiresAtMs = 0;
    };

    // Wygasłe wpisy usuwamy przy zapisie, odczyt nie modyfikuje mapy.
    void pruneLocked(qint64 now)
    {
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->expiresAtMs <= now) {
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::chrono::seconds  m_defaultTtl;
    Clock                 m_clock;
    mutable std::mutex    m_mutex;
    QHash<QString, Entry> m_entries;
};

} // namespace marketbrief
