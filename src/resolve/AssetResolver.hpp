#pragma once

#include <QString>
#include <QVector>

#include <chrono>
#include <memory>
#include <optional>

#include "cache/TtlCache.hpp"
#include "models/AssetTypes.hpp"
#include "models/QueryTypes.hpp"
#include "providers/MarketDataProvider.hpp"
#include "resolve/ConflictDetector.hpp"
#include "resolve/ResolverStrategy.hpp"

class QThreadPool;

namespace marketbrief {

/*!
 * Maps extracted candidates to canonical assets.
 *
 * Each candidate walks the tiers equity lookup -> crypto lookup -> crypto
 * search, stopping at the first hit. Candidates are resolved in parallel on the
 * worker pool and recombined in extraction order. Only the first
 * `maxCryptoCandidates` candidates may touch the crypto provider.
 */
class AssetResolver {
public:
    struct Options {
        int                  maxCryptoCandidates = 2;
        std::chrono::seconds lookupTtl{300};
        QString              contractPlatform = QStringLiteral("ethereum");
    };

    AssetResolver(std::shared_ptr<MarketDataProviderInterface> equityProvider,
                  std::shared_ptr<CryptoDataProviderInterface> cryptoProvider);
    AssetResolver(std::shared_ptr<MarketDataProviderInterface> equityProvider,
                  std::shared_ptr<CryptoDataProviderInterface> cryptoProvider,
                  Options options);

    AssetResolver(const AssetResolver&) = delete;
    AssetResolver& operator=(const AssetResolver&) = delete;

    ResolutionResult resolve(const QVector<CandidateSymbol>& candidates) const;

    //! Tier chain used for one candidate, exposed so tiers can be exercised in isolation.
    QVector<ResolverStrategy> strategies() const;

    static ResolutionInput makeInput(const CandidateSymbol& candidate, int index, int maxCryptoCandidates);

    const Options& options() const { return m_options; }

    void setThreadPool(QThreadPool* pool);
    TtlCache<ResolvedAsset>& lookupCacheForTesting() { return m_lookupCache; }

private:
    struct CandidateOutcome {
        QString                       rawSymbol;
        std::optional<ResolvedAsset>  asset;
        std::optional<ConflictReport> conflict;
    };

    CandidateOutcome resolveCandidate(const ResolutionInput& input) const;

    std::optional<ResolvedAsset> lookupEquity(const QString& symbol) const;
    std::optional<ResolvedAsset> lookupCrypto(const QString& symbol) const;
    std::optional<ResolvedAsset> searchCrypto(const ResolutionInput& input) const;
    std::optional<ResolvedAsset> lookupContract(const QString& address) const;

    static QStringList searchVariations(const ResolutionInput& input);

    std::shared_ptr<MarketDataProviderInterface> m_equityProvider;
    std::shared_ptr<CryptoDataProviderInterface> m_cryptoProvider;
    Options                                      m_options;
    ConflictDetector                             m_conflictDetector;
    mutable TtlCache<ResolvedAsset>              m_lookupCache;
    QThreadPool*                                 m_threadPool = nullptr;
};

} // namespace marketbrief
