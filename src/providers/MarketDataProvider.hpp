#pragma once

#include <QString>
#include <QVector>

#include <optional>

#include "models/AssetTypes.hpp"
#include "models/IndicatorTypes.hpp"
#include "models/Result.hpp"

namespace marketbrief {

using AssetLookup = Result<std::optional<ResolvedAsset>>;
using IndicatorFetch = Result<QVector<IndicatorPoint>>;
using AssetSearch = Result<QVector<ResolvedAsset>>;

//! Equity/primary quote and indicator source. Implementations must be callable from worker threads.
class MarketDataProviderInterface {
public:
    virtual ~MarketDataProviderInterface() = default;

    virtual QString providerId() const = 0;
    virtual AssetLookup lookupBySymbol(const QString& symbol) = 0;
    virtual IndicatorFetch fetchIndicator(const QString& symbol, IndicatorType type, const QString& timeframe,
                                          int period) = 0;
};

//! Crypto-specific lookup and search index.
class CryptoDataProviderInterface {
public:
    virtual ~CryptoDataProviderInterface() = default;

    virtual QString providerId() const = 0;
    virtual AssetLookup lookupBySymbol(const QString& normalizedSymbol) = 0;
    //! Ranked best-first.
    virtual AssetSearch search(const QString& queryText) = 0;
    virtual AssetLookup lookupByContract(const QString& platform, const QString& address) = 0;
};

} // namespace marketbrief
