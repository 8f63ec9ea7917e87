#include <QtTest/QtTest>
#include <QThreadPool>

#include <memory>

#include "resolve/AssetResolver.hpp"
#include "support/FakeProviders.hpp"

using namespace marketbrief;
using namespace marketbrief::testing;

namespace {

CandidateSymbol candidate(const QString& text, CandidateSymbol::Origin origin = CandidateSymbol::Origin::BareTicker)
{
    return CandidateSymbol{text, origin, 0.9, 0};
}

} // namespace

class AssetResolverTest : public QObject {
    Q_OBJECT

private slots:
    void init();

    void resolvesEquityFirst();
    void fallsBackToCryptoLookup();
    void stripsQuoteSuffixBeforeCryptoLookup();
    void searchPrefersExactSymbol();
    void searchFallsBackToTopResult();
    void boundsCryptoPathToFirstTwoCandidates();
    void crossClassCollisionYieldsConflict();
    void identicalNamesAreNotConflict();
    void searchMatchUnderOtherSymbolIsNotConflict();
    void upstreamFailureFallsThroughToNextTier();
    void unresolvedCandidateIsOmitted();
    void duplicateInstrumentsCollapse();
    void lookupCacheAvoidsRepeatCalls();
    void contractAddressUsesContractLookup();
    void firstNonEmptyStopsAtFirstHit();

private:
    std::unique_ptr<AssetResolver> makeResolver();

    std::shared_ptr<FakeMarketDataProvider> m_equity;
    std::shared_ptr<FakeCryptoDataProvider> m_crypto;
    QThreadPool                             m_pool;
};

void AssetResolverTest::init()
{
    m_equity = std::make_shared<FakeMarketDataProvider>();
    m_crypto = std::make_shared<FakeCryptoDataProvider>();
    m_pool.setMaxThreadCount(4);
}

std::unique_ptr<AssetResolver> AssetResolverTest::makeResolver()
{
    auto resolver = std::make_unique<AssetResolver>(m_equity, m_crypto);
    resolver->setThreadPool(&m_pool);
    return resolver;
}

void AssetResolverTest::resolvesEquityFirst()
{
    m_equity->addAsset(makeAsset(QStringLiteral("AAPL"), QStringLiteral("Apple Inc."), AssetClass::Equity, 190.0));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("AAPL"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("AAPL"));
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Equity);
    QCOMPARE(result.assets.constFirst().providerId, QStringLiteral("fake-equity"));
    QVERIFY(result.conflicts.isEmpty());
    QCOMPARE(m_crypto->searchCalls.load(), 0);
}

void AssetResolverTest::fallsBackToCryptoLookup()
{
    m_crypto->addAsset(makeAsset(QStringLiteral("ETH"), QStringLiteral("Ethereum"), AssetClass::Crypto, 3200.0));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("ETH"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().name, QStringLiteral("Ethereum"));
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Crypto);
    QVERIFY(m_equity->lookedUp.contains(QStringLiteral("ETH")));
    QCOMPARE(m_crypto->searchCalls.load(), 0);
}

void AssetResolverTest::stripsQuoteSuffixBeforeCryptoLookup()
{
    m_crypto->addAsset(makeAsset(QStringLiteral("KTA"), QStringLiteral("Keeta"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("KTAUSD"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("KTA"));
    QVERIFY(m_crypto->lookedUp.contains(QStringLiteral("KTA")));
    QVERIFY(!m_crypto->lookedUp.contains(QStringLiteral("KTAUSD")));
}

void AssetResolverTest::searchPrefersExactSymbol()
{
    m_crypto->searchResults.insert(QStringLiteral("floki"),
                                   {makeAsset(QStringLiteral("FLOKIINU"), QStringLiteral("Floki Inu"), AssetClass::Crypto),
                                    makeAsset(QStringLiteral("FLOKI"), QStringLiteral("Floki"), AssetClass::Crypto)});

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(QStringLiteral("Floki"), CandidateSymbol::Origin::Word)});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("FLOKI"));
    QCOMPARE(m_crypto->searched, QStringList{QStringLiteral("FLOKI")});
}

void AssetResolverTest::searchFallsBackToTopResult()
{
    m_crypto->searchResults.insert(QStringLiteral("venice"),
                                   {makeAsset(QStringLiteral("VVV"), QStringLiteral("Venice Token"), AssetClass::Crypto),
                                    makeAsset(QStringLiteral("VSW"), QStringLiteral("VeniceSwap"), AssetClass::Crypto)});

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(QStringLiteral("Venice"), CandidateSymbol::Origin::InstrumentName)});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("VVV"));
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Crypto);
}

void AssetResolverTest::boundsCryptoPathToFirstTwoCandidates()
{
    for (const QString& symbol : {QStringLiteral("AAA"), QStringLiteral("BBB"), QStringLiteral("CCC")}) {
        m_crypto->addAsset(makeAsset(symbol, symbol + QStringLiteral(" Protocol"), AssetClass::Crypto));
    }

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve(
        {candidate(QStringLiteral("AAA")), candidate(QStringLiteral("BBB")), candidate(QStringLiteral("CCC"))});

    QCOMPARE(result.assets.size(), 2);
    QCOMPARE(result.assets.at(0).symbol, QStringLiteral("AAA"));
    QCOMPARE(result.assets.at(1).symbol, QStringLiteral("BBB"));
    QCOMPARE(result.unresolved, QStringList{QStringLiteral("CCC")});
    QVERIFY(!m_crypto->lookedUp.contains(QStringLiteral("CCC")));
    QVERIFY(!m_crypto->searched.contains(QStringLiteral("CCC")));
    QVERIFY(m_equity->lookedUp.contains(QStringLiteral("CCC")));
}

void AssetResolverTest::crossClassCollisionYieldsConflict()
{
    m_equity->addAsset(makeAsset(QStringLiteral("VVV"), QStringLiteral("Valvoline Inc."), AssetClass::Equity));
    m_crypto->addAsset(makeAsset(QStringLiteral("VVV"), QStringLiteral("Venice Token"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("VVV"))});

    QVERIFY(result.isAmbiguous());
    QVERIFY(result.assets.isEmpty());
    QCOMPARE(result.conflicts.size(), 1);
    const ConflictReport& report = result.conflicts.constFirst();
    QCOMPARE(report.candidate, QStringLiteral("VVV"));
    QCOMPARE(report.matches.size(), 2);
    QVERIFY(report.matches.at(0).assetClass != report.matches.at(1).assetClass);
}

void AssetResolverTest::identicalNamesAreNotConflict()
{
    m_equity->addAsset(makeAsset(QStringLiteral("LINK"), QStringLiteral("Chainlink"), AssetClass::Equity));
    m_crypto->addAsset(makeAsset(QStringLiteral("LINK"), QStringLiteral("chainlink"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("LINK"))});

    QVERIFY(!result.isAmbiguous());
    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Equity);
}

void AssetResolverTest::searchMatchUnderOtherSymbolIsNotConflict()
{
    m_equity->addAsset(makeAsset(QStringLiteral("VVV"), QStringLiteral("Valvoline Inc."), AssetClass::Equity));
    m_crypto->searchResults.insert(QStringLiteral("venice"),
                                   {makeAsset(QStringLiteral("VVV"), QStringLiteral("Venice Token"), AssetClass::Crypto)});

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(QStringLiteral("Venice"), CandidateSymbol::Origin::InstrumentName)});

    QVERIFY(!result.isAmbiguous());
    QVERIFY(result.conflicts.isEmpty());
    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("VVV"));
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Crypto);
    QVERIFY(!m_equity->lookedUp.contains(QStringLiteral("VVV")));
}

void AssetResolverTest::upstreamFailureFallsThroughToNextTier()
{
    m_equity->unavailable = true;
    m_crypto->addAsset(makeAsset(QStringLiteral("ETH"), QStringLiteral("Ethereum"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result = resolver->resolve({candidate(QStringLiteral("ETH"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().assetClass, AssetClass::Crypto);
}

void AssetResolverTest::unresolvedCandidateIsOmitted()
{
    m_crypto->addAsset(makeAsset(QStringLiteral("SOL"), QStringLiteral("Solana"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(QStringLiteral("ZZZZ")), candidate(QStringLiteral("SOL"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("SOL"));
    QCOMPARE(result.unresolved, QStringList{QStringLiteral("ZZZZ")});
}

void AssetResolverTest::duplicateInstrumentsCollapse()
{
    m_crypto->addAsset(makeAsset(QStringLiteral("ETH"), QStringLiteral("Ethereum"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(QStringLiteral("ETH")), candidate(QStringLiteral("ETHUSD"))});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("ETH"));
}

void AssetResolverTest::lookupCacheAvoidsRepeatCalls()
{
    m_equity->addAsset(makeAsset(QStringLiteral("MSFT"), QStringLiteral("Microsoft"), AssetClass::Equity));

    const auto resolver = makeResolver();
    resolver->resolve({candidate(QStringLiteral("MSFT"))});
    const ResolutionResult second = resolver->resolve({candidate(QStringLiteral("MSFT"))});

    QCOMPARE(second.assets.size(), 1);
    QCOMPARE(m_equity->lookupCalls.load(), 1);
}

void AssetResolverTest::contractAddressUsesContractLookup()
{
    const QString address = QStringLiteral("0x6982508145454ce325ddbe47a25d4ec3d2311933");
    m_crypto->contracts.insert(QStringLiteral("ethereum:") + address,
                               makeAsset(QStringLiteral("PEPE"), QStringLiteral("Pepe"), AssetClass::Crypto));

    const auto resolver = makeResolver();
    const ResolutionResult result =
        resolver->resolve({candidate(address, CandidateSymbol::Origin::ContractAddress)});

    QCOMPARE(result.assets.size(), 1);
    QCOMPARE(result.assets.constFirst().symbol, QStringLiteral("PEPE"));
    QCOMPARE(m_crypto->contractCalls.load(), 1);
    QCOMPARE(m_equity->lookupCalls.load(), 0);
}

void AssetResolverTest::firstNonEmptyStopsAtFirstHit()
{
    int laterCalls = 0;
    const QVector<ResolverStrategy> strategies{
        {QStringLiteral("empty"), [](const ResolutionInput&) { return std::optional<ResolvedAsset>(); }},
        {QStringLiteral("hit"),
         [](const ResolutionInput& input) {
             return std::optional<ResolvedAsset>(makeAsset(input.rawSymbol, QStringLiteral("Hit"), AssetClass::Crypto));
         }},
        {QStringLiteral("later"),
         [&laterCalls](const ResolutionInput&) {
             ++laterCalls;
             return std::optional<ResolvedAsset>();
         }},
    };

    const ResolutionInput input = AssetResolver::makeInput(candidate(QStringLiteral("abc")), 0, 2);
    const auto match = firstNonEmpty(strategies, input);

    QVERIFY(match.has_value());
    QCOMPARE(match->strategyName, QStringLiteral("hit"));
    QCOMPARE(match->asset.symbol, QStringLiteral("ABC"));
    QCOMPARE(laterCalls, 0);
    QVERIFY(!firstNonEmpty({}, input).has_value());
}

QTEST_MAIN(AssetResolverTest)
#include "AssetResolverTest.moc"
