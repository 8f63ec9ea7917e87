#pragma once

#include <QString>

#include <chrono>
#include <functional>
#include <mutex>

namespace marketbrief {

//! Opens after `failureThreshold` consecutive upstream failures and rejects calls until `openDuration` elapses.
class CircuitBreaker {
public:
    using Clock = std::function<qint64()>;

    CircuitBreaker(QString name, int failureThreshold = 5, std::chrono::seconds openDuration = std::chrono::seconds(300));

    bool allowRequest();
    void recordSuccess();
    void recordFailure();

    bool isOpen() const;
    int failureCount() const;
    const QString& name() const { return m_name; }

    void setClockForTesting(Clock clock);

private:
    QString              m_name;
    int                  m_failureThreshold;
    std::chrono::seconds m_openDuration;
    Clock                m_clock;

    mutable std::mutex m_mutex;
    int                m_failures = 0;
    qint64             m_openedAtMs = -1;
};

} // namespace marketbrief
