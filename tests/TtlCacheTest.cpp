#include <QtTest/QtTest>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent>

#include <atomic>
#include <memory>

#include "cache/TtlCache.hpp"

using marketbrief::TtlCache;

class TtlCacheTest : public QObject {
    Q_OBJECT

private slots:
    void returnsValueWithinTtl();
    void expiresAfterTtl();
    void perEntryTtlOverridesDefault();
    void writePrunesExpiredEntries();
    void concurrentWritersLastOneWins();
};

namespace {

struct ManualClock {
    std::shared_ptr<std::atomic<qint64>> now = std::make_shared<std::atomic<qint64>>(1'000'000);

    TtlCache<int>::Clock function() const
    {
        auto shared = now;
        return [shared] { return shared->load(); };
    }

    void advanceSeconds(int seconds) { *now += static_cast<qint64>(seconds) * 1000; }
};

} // namespace

void TtlCacheTest::returnsValueWithinTtl()
{
    ManualClock clock;
    TtlCache<int> cache(std::chrono::seconds(60));
    cache.setClockForTesting(clock.function());

    cache.put(QStringLiteral("indicator:RSI:ETHUSD:2h:28"), 42);
    clock.advanceSeconds(59);

    const auto value = cache.get(QStringLiteral("indicator:RSI:ETHUSD:2h:28"));
    QVERIFY(value.has_value());
    QCOMPARE(*value, 42);
    QVERIFY(!cache.get(QStringLiteral("indicator:RSI:BTCUSD:2h:28")).has_value());
}

void TtlCacheTest::expiresAfterTtl()
{
    ManualClock clock;
    TtlCache<int> cache(std::chrono::seconds(60));
    cache.setClockForTesting(clock.function());

    cache.put(QStringLiteral("key"), 1);
    clock.advanceSeconds(60);
    QVERIFY(!cache.get(QStringLiteral("key")).has_value());
}

void TtlCacheTest::perEntryTtlOverridesDefault()
{
    ManualClock clock;
    TtlCache<int> cache(std::chrono::seconds(3600));
    cache.setClockForTesting(clock.function());

    cache.put(QStringLiteral("short"), 1, std::chrono::seconds(300));
    cache.put(QStringLiteral("long"), 2);
    clock.advanceSeconds(301);

    QVERIFY(!cache.get(QStringLiteral("short")).has_value());
    QCOMPARE(cache.get(QStringLiteral("long")).value_or(-1), 2);
}

void TtlCacheTest::writePrunesExpiredEntries()
{
    ManualClock clock;
    TtlCache<int> cache(std::chrono::seconds(10));
    cache.setClockForTesting(clock.function());

    cache.put(QStringLiteral("a"), 1);
    cache.put(QStringLiteral("b"), 2);
    QCOMPARE(cache.size(), 2);

    clock.advanceSeconds(11);
    cache.put(QStringLiteral("c"), 3);
    QCOMPARE(cache.size(), 1);

    cache.remove(QStringLiteral("c"));
    QCOMPARE(cache.size(), 0);
}

void TtlCacheTest::concurrentWritersLastOneWins()
{
    TtlCache<int> cache;
    QThreadPool pool;
    pool.setMaxThreadCount(4);

    QVector<QFuture<void>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.append(QtConcurrent::run(&pool, [&cache, i]() { cache.put(QStringLiteral("shared"), i); }));
    }
    for (auto& future : futures) {
        future.waitForFinished();
    }

    const auto value = cache.get(QStringLiteral("shared"));
    QVERIFY(value.has_value());
    QVERIFY(*value >= 0 && *value < 32);
    QCOMPARE(cache.size(), 1);
}

QTEST_MAIN(TtlCacheTest)
#include "TtlCacheTest.moc"
