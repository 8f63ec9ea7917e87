#include <QtTest/QtTest>
#include <QThreadPool>
#include <QVariantMap>

#include <memory>

#include "indicators/IndicatorAggregator.hpp"
#include "support/FakeProviders.hpp"

using namespace marketbrief;
using namespace marketbrief::testing;

class IndicatorAggregatorTest : public QObject {
    Q_OBJECT

private slots:
    void init();

    void fetchesFullIndicatorSet();
    void truncatesNewestFirst();
    void failedIndicatorLeavesOthers();
    void emptySeriesIsOmitted();
    void cachesUpstreamSeries();
    void cacheKeyIncludesTimeframeAndPeriod();
    void acceptsMapAndAssetTickers();
    void rejectsUnsupportedTickers();
    void fanOutKeepsAssetOrder();

private:
    std::unique_ptr<IndicatorAggregator> makeAggregator();

    std::shared_ptr<FakeMarketDataProvider> m_provider;
    QThreadPool                             m_pool;
};

void IndicatorAggregatorTest::init()
{
    m_provider = std::make_shared<FakeMarketDataProvider>();
    m_pool.setMaxThreadCount(4);
}

std::unique_ptr<IndicatorAggregator> IndicatorAggregatorTest::makeAggregator()
{
    auto aggregator = std::make_unique<IndicatorAggregator>(m_provider);
    aggregator->setThreadPool(&m_pool);
    return aggregator;
}

void IndicatorAggregatorTest::fetchesFullIndicatorSet()
{
    m_provider->setSeriesForAll(QStringLiteral("AAPL"), 5, 55.0);

    const auto aggregator = makeAggregator();
    const Result<IndicatorMap> result = aggregator->fetchIndicators(QVariant(QStringLiteral("aapl")));

    QVERIFY(result.ok());
    const IndicatorMap& map = result.value();
    QCOMPARE(map.size(), 4);
    QVERIFY(map.contains(IndicatorType::Rsi));
    QVERIFY(map.contains(IndicatorType::Ema));
    QVERIFY(map.contains(IndicatorType::Sma));
    QVERIFY(map.contains(IndicatorType::Dema));

    const IndicatorSeries& rsi = map.value(IndicatorType::Rsi);
    QCOMPARE(rsi.timeframe, QStringLiteral("2h"));
    QCOMPARE(rsi.period, 28);
    QCOMPARE(rsi.points.constFirst().timeframe, QStringLiteral("2h"));
    QCOMPARE(rsi.points.constFirst().period, 28);
    QCOMPARE(map.value(IndicatorType::Sma).period, 200);
    QVERIFY(m_provider->requests.contains(QStringLiteral("RSI:AAPL:2h:28")));
    QVERIFY(m_provider->requests.contains(QStringLiteral("EMA:AAPL:4h:50")));
}

void IndicatorAggregatorTest::truncatesNewestFirst()
{
    m_provider->setSeries(QStringLiteral("BTCUSD"), IndicatorType::Rsi, makePoints(30, 64.0));

    const auto aggregator = makeAggregator();
    const IndicatorMap map =
        aggregator->fetchIndicators(makeAsset(QStringLiteral("BTC"), QStringLiteral("Bitcoin"), AssetClass::Crypto));

    QCOMPARE(map.size(), 1);
    const IndicatorSeries rsi = map.value(IndicatorType::Rsi);
    QCOMPARE(rsi.points.size(), 12);
    QCOMPARE(rsi.points.constFirst().value, 64.0);
    QVERIFY(rsi.points.at(0).date > rsi.points.at(1).date);
    QCOMPARE(rsi.latestValue().value_or(0.0), 64.0);
}

void IndicatorAggregatorTest::failedIndicatorLeavesOthers()
{
    m_provider->setSeriesForAll(QStringLiteral("MSFT"), 3, 48.0);
    m_provider->failingIndicators.insert(QStringLiteral("SMA"));

    const auto aggregator = makeAggregator();
    const IndicatorMap map =
        aggregator->fetchIndicators(makeAsset(QStringLiteral("MSFT"), QStringLiteral("Microsoft"), AssetClass::Equity));

    QCOMPARE(map.size(), 3);
    QVERIFY(!map.contains(IndicatorType::Sma));
    QVERIFY(map.contains(IndicatorType::Rsi));
}

void IndicatorAggregatorTest::emptySeriesIsOmitted()
{
    m_provider->setSeries(QStringLiteral("TSLA"), IndicatorType::Ema, makePoints(4, 210.0));

    const auto aggregator = makeAggregator();
    const IndicatorMap map =
        aggregator->fetchIndicators(makeAsset(QStringLiteral("TSLA"), QStringLiteral("Tesla"), AssetClass::Equity));

    QCOMPARE(map.size(), 1);
    QVERIFY(map.contains(IndicatorType::Ema));
    QCOMPARE(m_provider->indicatorCalls.load(), 4);
}

void IndicatorAggregatorTest::cachesUpstreamSeries()
{
    m_provider->setSeriesForAll(QStringLiteral("NVDA"), 6, 71.0);
    const ResolvedAsset asset = makeAsset(QStringLiteral("NVDA"), QStringLiteral("NVIDIA"), AssetClass::Equity);

    const auto aggregator = makeAggregator();
    const IndicatorMap first = aggregator->fetchIndicators(asset);
    const IndicatorMap second = aggregator->fetchIndicators(asset);

    QCOMPARE(first.size(), 4);
    QCOMPARE(second.size(), 4);
    QCOMPARE(m_provider->indicatorCalls.load(), 4);
    QVERIFY(aggregator->cacheForTesting().get(QStringLiteral("indicator:RSI:NVDA:2h:28")).has_value());
}

void IndicatorAggregatorTest::cacheKeyIncludesTimeframeAndPeriod()
{
    QCOMPARE(IndicatorAggregator::cacheKey(IndicatorType::Rsi, QStringLiteral("ethusd"), QStringLiteral("2h"), 28),
             QStringLiteral("indicator:RSI:ETHUSD:2h:28"));
    QCOMPARE(IndicatorAggregator::cacheKey(IndicatorType::Dema, QStringLiteral("SPY"), QStringLiteral("4h"), 20),
             QStringLiteral("indicator:DEMA:SPY:4h:20"));
}

void IndicatorAggregatorTest::acceptsMapAndAssetTickers()
{
    QVariantMap map;
    map.insert(QStringLiteral("symbol"), QStringLiteral("aapl"));
    QCOMPARE(IndicatorAggregator::normalizeTicker(map).value_or(QString()), QStringLiteral("AAPL"));

    const QVariant crypto =
        QVariant::fromValue(makeAsset(QStringLiteral("ETH"), QStringLiteral("Ethereum"), AssetClass::Crypto));
    QCOMPARE(IndicatorAggregator::normalizeTicker(crypto).value_or(QString()), QStringLiteral("ETHUSD"));

    QCOMPARE(IndicatorAggregator::normalizeTicker(QVariant(QByteArray("brk.b"))).value_or(QString()),
             QStringLiteral("BRK.B"));
}

void IndicatorAggregatorTest::rejectsUnsupportedTickers()
{
    const auto aggregator = makeAggregator();

    const Result<IndicatorMap> number = aggregator->fetchIndicators(QVariant(42));
    QVERIFY(!number.ok());
    QCOMPARE(number.error(), ErrorKind::InvalidArgument);

    QVariantMap withoutSymbol;
    withoutSymbol.insert(QStringLiteral("name"), QStringLiteral("Apple"));
    const Result<IndicatorMap> map = aggregator->fetchIndicators(withoutSymbol);
    QVERIFY(!map.ok());
    QCOMPARE(map.error(), ErrorKind::InvalidArgument);

    QVERIFY(!IndicatorAggregator::normalizeTicker(QVariant(QStringLiteral("rm -rf /"))).has_value());
    QCOMPARE(m_provider->indicatorCalls.load(), 0);
}

void IndicatorAggregatorTest::fanOutKeepsAssetOrder()
{
    m_provider->setSeriesForAll(QStringLiteral("SPY"), 3, 52.0);
    m_provider->setSeries(QStringLiteral("SOLUSD"), IndicatorType::Rsi, makePoints(3, 33.0));

    const auto aggregator = makeAggregator();
    const QVector<IndicatorMap> maps = aggregator->fetchIndicatorsForAssets(
        {makeAsset(QStringLiteral("SPY"), QStringLiteral("SPDR S&P 500"), AssetClass::Equity),
         makeAsset(QStringLiteral("SOL"), QStringLiteral("Solana"), AssetClass::Crypto)});

    QCOMPARE(maps.size(), 2);
    QCOMPARE(maps.at(0).size(), 4);
    QCOMPARE(maps.at(0).value(IndicatorType::Rsi).latestValue().value_or(0.0), 52.0);
    QCOMPARE(maps.at(1).size(), 1);
    QCOMPARE(maps.at(1).value(IndicatorType::Rsi).latestValue().value_or(0.0), 33.0);
}

QTEST_MAIN(IndicatorAggregatorTest)
#include "IndicatorAggregatorTest.moc"
