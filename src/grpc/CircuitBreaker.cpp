#include "CircuitBreaker.hpp"

#include <QDateTime>
#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcCircuitBreaker, "marketbrief.gateway.breaker")

namespace marketbrief {

CircuitBreaker::CircuitBreaker(QString name, int failureThreshold, std::chrono::seconds openDuration)
    : m_name(std::move(name))
    , m_failureThreshold(qMax(1, failureThreshold))
    , m_openDuration(openDuration)
    , m_clock([] { return QDateTime::currentMSecsSinceEpoch(); })
{
}

bool CircuitBreaker::allowRequest()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_openedAtMs < 0) {
        return true;
    }
    if (m_clock() - m_openedAtMs >= static_cast<qint64>(m_openDuration.count()) * 1000) {
        qCInfo(lcCircuitBreaker) << "Obwód" << m_name << "zamknięty po okresie karencji";
        m_openedAtMs = -1;
        m_failures = 0;
        return true;
    }
    return false;
}

void CircuitBreaker::recordSuccess()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failures = 0;
    m_openedAtMs = -1;
}

void CircuitBreaker::recordFailure()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_failures;
    if (m_openedAtMs < 0 && m_failures >= m_failureThreshold) {
        m_openedAtMs = m_clock();
        qCWarning(lcCircuitBreaker) << "Obwód" << m_name << "otwarty po" << m_failures << "błędach z rzędu";
    }
}

bool CircuitBreaker::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_openedAtMs >= 0 && m_clock() - m_openedAtMs < static_cast<qint64>(m_openDuration.count()) * 1000;
}

int CircuitBreaker::failureCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_failures;
}

void CircuitBreaker::setClockForTesting(Clock clock)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (clock) {
        m_clock = std::move(clock);
    }
}

} // namespace marketbrief
