#include <QtTest/QtTest>

#include <memory>

#include "context/BellwetherSelector.hpp"
#include "support/FakeProviders.hpp"

using namespace marketbrief;
using namespace marketbrief::testing;

class BellwetherSelectorTest : public QObject {
    Q_OBJECT

private slots:
    void unmatchedQueryUsesDefaultSymbols();
    void unionIsDeduplicatedAndCapped();
    void readsSnapshotsTruncated();
    void skipsSymbolsWithoutSnapshots();
    void nothingAvailableYieldsNullopt();
};

void BellwetherSelectorTest::unmatchedQueryUsesDefaultSymbols()
{
    QCOMPARE(BellwetherSelector::symbolsFor(QueryClassification{}), BellwetherSelector::defaultSymbols());
}

void BellwetherSelectorTest::unionIsDeduplicatedAndCapped()
{
    QueryClassification crypto;
    crypto.categories = {Category::Crypto, Category::Technical};
    QCOMPARE(BellwetherSelector::symbolsFor(crypto),
             (QStringList{QStringLiteral("BTC"), QStringLiteral("ETH"), QStringLiteral("SOL"), QStringLiteral("SPY"),
                          QStringLiteral("QQQ")}));

    QueryClassification wide;
    wide.categories = {Category::Options, Category::Memecoin, Category::Forex};
    QStringList symbols = BellwetherSelector::symbolsFor(wide);
    QCOMPARE(symbols.size(), int(BellwetherSelector::kMaxBellwethers));
    QCOMPARE(symbols.removeDuplicates(), qsizetype(0));
    QCOMPARE(symbols.constFirst(), QStringLiteral("SPY"));
}

void BellwetherSelectorTest::readsSnapshotsTruncated()
{
    auto store = std::make_shared<FakeAssetStore>();
    store->addBellwether(QStringLiteral("BTC"), QStringLiteral("Bitcoin"), 20, 62.0);

    QueryClassification classification;
    classification.categories = {Category::Crypto};
    const auto entries = BellwetherSelector(store, 12).select(classification);

    QVERIFY(entries.has_value());
    QCOMPARE(entries->size(), 1);
    const BellwetherEntry& btc = entries->constFirst();
    QCOMPARE(btc.name, QStringLiteral("Bitcoin"));
    QVERIFY(btc.rsi.has_value());
    QVERIFY(!btc.ema.has_value());
    QCOMPARE(btc.rsi->points.size(), 12);
    QCOMPARE(btc.rsi->latestValue().value_or(0.0), 62.0);
}

void BellwetherSelectorTest::skipsSymbolsWithoutSnapshots()
{
    auto store = std::make_shared<FakeAssetStore>();
    store->addBellwether(QStringLiteral("SPY"), QStringLiteral("SPDR S&P 500"), 3, 48.0);
    store->profiles.insert(QStringLiteral("QQQ"), {QStringLiteral("QQQ"), QStringLiteral("Invesco QQQ"), QString()});
    IndicatorSeries ema;
    ema.type = IndicatorType::Ema;
    ema.points = makePoints(2, 101.0);
    store->snapshots.insert(QStringLiteral("EMA:BTC"), ema);

    const auto entries = BellwetherSelector(store).select(QueryClassification{});

    QVERIFY(entries.has_value());
    QCOMPARE(entries->size(), 2);
    QCOMPARE(entries->at(0).symbol, QStringLiteral("SPY"));
    QCOMPARE(entries->at(1).symbol, QStringLiteral("BTC"));
    // Bez profilu nazwa przyjmuje symbol.
    QCOMPARE(entries->at(1).name, QStringLiteral("BTC"));
    QVERIFY(entries->at(1).ema.has_value());
}

void BellwetherSelectorTest::nothingAvailableYieldsNullopt()
{
    auto store = std::make_shared<FakeAssetStore>();
    QVERIFY(!BellwetherSelector(store).select(QueryClassification{}).has_value());
    QVERIFY(!BellwetherSelector(nullptr).select(QueryClassification{}).has_value());
}

QTEST_MAIN(BellwetherSelectorTest)
#include "BellwetherSelectorTest.moc"
