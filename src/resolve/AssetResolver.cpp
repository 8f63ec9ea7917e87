#include "AssetResolver.hpp"

#include <QFuture>
#include <QLoggingCategory>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>
#include <utility>

#include "query/SymbolExtractor.hpp"
#include "resolve/SymbolNormalizer.hpp"

Q_LOGGING_CATEGORY(lcAssetResolver, "marketbrief.resolve.assets")

namespace marketbrief {

namespace {

QString lookupCacheKey(const QString& providerId, const QString& symbol)
{
    return QStringLiteral("lookup:%1:%2").arg(providerId, symbol.trimmed().toUpper());
}

std::optional<ResolvedAsset> unwrapLookup(const AssetLookup& lookup, const QString& providerId, const QString& symbol)
{
    if (!lookup.ok()) {
        if (lookup.error() != ErrorKind::NotFound) {
            qCWarning(lcAssetResolver) << "Dostawca" << providerId << "nie odpowiedział dla" << symbol << "-"
                                       << errorKindName(lookup.error()) << lookup.errorMessage();
        }
        return std::nullopt;
    }
    return lookup.value();
}

bool containsInstrument(const QVector<ResolvedAsset>& assets, const ResolvedAsset& asset)
{
    return std::any_of(assets.cbegin(), assets.cend(), [&asset](const ResolvedAsset& existing) {
        return existing.isSameInstrument(asset);
    });
}

} // namespace

AssetResolver::AssetResolver(std::shared_ptr<MarketDataProviderInterface> equityProvider,
                             std::shared_ptr<CryptoDataProviderInterface> cryptoProvider)
    : AssetResolver(std::move(equityProvider), std::move(cryptoProvider), Options{})
{
}

AssetResolver::AssetResolver(std::shared_ptr<MarketDataProviderInterface> equityProvider,
                             std::shared_ptr<CryptoDataProviderInterface> cryptoProvider,
                             Options options)
    : m_equityProvider(std::move(equityProvider))
    , m_cryptoProvider(std::move(cryptoProvider))
    , m_options(std::move(options))
    , m_conflictDetector([this](const QString& symbol) { return lookupEquity(symbol); },
                         [this](const QString& symbol) { return lookupCrypto(symbol); })
    , m_lookupCache(m_options.lookupTtl)
{
}

void AssetResolver::setThreadPool(QThreadPool* pool)
{
    m_threadPool = pool;
}

ResolutionInput AssetResolver::makeInput(const CandidateSymbol& candidate, int index, int maxCryptoCandidates)
{
    ResolutionInput input;
    input.candidate = candidate;
    const QString trimmed = candidate.text.simplified();
    input.rawSymbol = candidate.isMultiWord() ? trimmed : trimmed.toUpper();
    input.normalizedSymbol = candidate.isMultiWord() ? trimmed : stripQuoteSuffix(trimmed);
    input.cryptoEligible = index < maxCryptoCandidates;
    return input;
}

QVector<ResolverStrategy> AssetResolver::strategies() const
{
    QVector<ResolverStrategy> chain;
    chain.append({QStringLiteral("contract"), [this](const ResolutionInput& input) -> std::optional<ResolvedAsset> {
                      if (!input.candidate.isContractAddress() || !input.cryptoEligible) {
                          return std::nullopt;
                      }
                      return lookupContract(input.candidate.text);
                  }});
    chain.append({QStringLiteral("equity"), [this](const ResolutionInput& input) -> std::optional<ResolvedAsset> {
                      if (input.candidate.isContractAddress() || input.candidate.isMultiWord()
                          || !isValidTicker(input.rawSymbol)) {
                          return std::nullopt;
                      }
                      return lookupEquity(input.rawSymbol);
                  }});
    chain.append({QStringLiteral("crypto"), [this](const ResolutionInput& input) -> std::optional<ResolvedAsset> {
                      if (!input.cryptoEligible || input.candidate.isContractAddress()
                          || input.candidate.isMultiWord()) {
                          return std::nullopt;
                      }
                      return lookupCrypto(input.normalizedSymbol);
                  }});
    chain.append({QStringLiteral("search"), [this](const ResolutionInput& input) -> std::optional<ResolvedAsset> {
                      if (!input.cryptoEligible || input.candidate.isContractAddress()) {
                          return std::nullopt;
                      }
                      return searchCrypto(input);
                  }});
    return chain;
}

ResolutionResult AssetResolver::resolve(const QVector<CandidateSymbol>& candidates) const
{
    QThreadPool* pool = m_threadPool ? m_threadPool : QThreadPool::globalInstance();

    QVector<QFuture<CandidateOutcome>> futures;
    futures.reserve(candidates.size());
    for (int index = 0; index < candidates.size(); ++index) {
        const ResolutionInput input = makeInput(candidates.at(index), index, m_options.maxCryptoCandidates);
        futures.append(QtConcurrent::run(pool, [this, input]() { return resolveCandidate(input); }));
    }

    ResolutionResult result;
    for (QFuture<CandidateOutcome>& future : futures) {
        future.waitForFinished();
        const CandidateOutcome outcome = future.result();
        if (outcome.conflict) {
            const bool known = std::any_of(result.conflicts.cbegin(), result.conflicts.cend(),
                                           [&outcome](const ConflictReport& report) {
                                               return report.candidate.compare(outcome.conflict->candidate,
                                                                               Qt::CaseInsensitive)
                                                   == 0;
                                           });
            if (!known) {
                result.conflicts.append(*outcome.conflict);
            }
            continue;
        }
        if (!outcome.asset) {
            result.unresolved.append(outcome.rawSymbol);
            continue;
        }
        const bool inConflict = std::any_of(result.conflicts.cbegin(), result.conflicts.cend(),
                                            [&outcome](const ConflictReport& report) {
                                                return containsInstrument(report.matches, *outcome.asset);
                                            });
        if (inConflict || containsInstrument(result.assets, *outcome.asset)) {
            qCDebug(lcAssetResolver) << "Pomijam duplikat" << outcome.asset->symbol;
            continue;
        }
        result.assets.append(*outcome.asset);
    }
    return result;
}

AssetResolver::CandidateOutcome AssetResolver::resolveCandidate(const ResolutionInput& input) const
{
    CandidateOutcome outcome;
    outcome.rawSymbol = input.rawSymbol;

    const auto match = firstNonEmpty(strategies(), input);
    if (!match) {
        qCInfo(lcAssetResolver) << "Nie znaleziono aktywa dla kandydata" << input.rawSymbol;
        return outcome;
    }
    qCDebug(lcAssetResolver) << "Kandydat" << input.rawSymbol << "rozwiązany przez" << match->strategyName << "->"
                             << match->asset.symbol << assetClassName(match->asset.assetClass);

    if (!input.candidate.isContractAddress()) {
        outcome.conflict = m_conflictDetector.detect(input, match->asset);
    }
    outcome.asset = match->asset;
    return outcome;
}

std::optional<ResolvedAsset> AssetResolver::lookupEquity(const QString& symbol) const
{
    if (!m_equityProvider || symbol.trimmed().isEmpty()) {
        return std::nullopt;
    }
    const QString providerId = m_equityProvider->providerId();
    const QString key = lookupCacheKey(providerId, symbol);
    if (auto cached = m_lookupCache.get(key)) {
        return cached;
    }
    auto asset = unwrapLookup(m_equityProvider->lookupBySymbol(symbol.trimmed().toUpper()), providerId, symbol);
    if (asset) {
        asset->assetClass = AssetClass::Equity;
        if (asset->providerId.isEmpty()) {
            asset->providerId = providerId;
        }
        m_lookupCache.put(key, *asset);
    }
    return asset;
}

std::optional<ResolvedAsset> AssetResolver::lookupCrypto(const QString& symbol) const
{
    if (!m_cryptoProvider || symbol.trimmed().isEmpty()) {
        return std::nullopt;
    }
    const QString providerId = m_cryptoProvider->providerId();
    const QString key = lookupCacheKey(providerId, symbol);
    if (auto cached = m_lookupCache.get(key)) {
        return cached;
    }
    auto asset = unwrapLookup(m_cryptoProvider->lookupBySymbol(symbol.trimmed().toUpper()), providerId, symbol);
    if (asset) {
        asset->assetClass = AssetClass::Crypto;
        if (asset->providerId.isEmpty()) {
            asset->providerId = providerId;
        }
        m_lookupCache.put(key, *asset);
    }
    return asset;
}

std::optional<ResolvedAsset> AssetResolver::searchCrypto(const ResolutionInput& input) const
{
    if (!m_cryptoProvider) {
        return std::nullopt;
    }
    const QString providerId = m_cryptoProvider->providerId();
    for (const QString& variation : searchVariations(input)) {
        const AssetSearch search = m_cryptoProvider->search(variation);
        if (!search.ok()) {
            qCWarning(lcAssetResolver) << "Wyszukiwanie" << providerId << "dla" << variation << "nie powiodło się -"
                                       << errorKindName(search.error()) << search.errorMessage();
            continue;
        }
        const QVector<ResolvedAsset>& results = search.value();
        if (results.isEmpty()) {
            continue;
        }
        const auto exact = std::find_if(results.cbegin(), results.cend(), [&](const ResolvedAsset& asset) {
            return asset.symbol.compare(input.normalizedSymbol, Qt::CaseInsensitive) == 0
                || asset.symbol.compare(variation, Qt::CaseInsensitive) == 0;
        });
        ResolvedAsset chosen = exact != results.cend() ? *exact : results.first();
        chosen.assetClass = AssetClass::Crypto;
        if (chosen.providerId.isEmpty()) {
            chosen.providerId = providerId;
        }
        qCDebug(lcAssetResolver) << "Wyszukiwanie" << variation << "->" << chosen.symbol
                                 << (exact != results.cend() ? "dopasowanie dokładne" : "najlepszy wynik");
        return chosen;
    }
    return std::nullopt;
}

std::optional<ResolvedAsset> AssetResolver::lookupContract(const QString& address) const
{
    if (!m_cryptoProvider) {
        return std::nullopt;
    }
    const QString providerId = m_cryptoProvider->providerId();
    const QString key = lookupCacheKey(providerId, m_options.contractPlatform + QLatin1Char(':') + address);
    if (auto cached = m_lookupCache.get(key)) {
        return cached;
    }
    auto asset = unwrapLookup(m_cryptoProvider->lookupByContract(m_options.contractPlatform, address.toLower()),
                              providerId, address);
    if (asset) {
        asset->assetClass = AssetClass::Crypto;
        if (asset->providerId.isEmpty()) {
            asset->providerId = providerId;
        }
        m_lookupCache.put(key, *asset);
    }
    return asset;
}

QStringList AssetResolver::searchVariations(const ResolutionInput& input)
{
    QStringList variations{input.normalizedSymbol};
    if (input.candidate.isMultiWord()) {
        const QString stripped = SymbolExtractor::stripFillerWords(input.candidate.text);
        if (!variations.contains(stripped, Qt::CaseInsensitive)) {
            variations.append(stripped);
        }
        const QStringList words = stripped.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        for (const QString& word : words) {
            if (word.size() > 3 && !SymbolExtractor::isFillerWord(word)) {
                if (!variations.contains(word, Qt::CaseInsensitive)) {
                    variations.append(word);
                }
                break;
            }
        }
    }
    variations.removeAll(QString());
    return variations;
}

} // namespace marketbrief
