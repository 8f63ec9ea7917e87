#pragma once

#include <QString>
#include <QVariant>
#include <QVector>

#include <chrono>
#include <memory>
#include <optional>

#include "cache/TtlCache.hpp"
#include "models/AssetTypes.hpp"
#include "models/IndicatorTypes.hpp"
#include "models/Result.hpp"
#include "providers/MarketDataProvider.hpp"

class QThreadPool;

namespace marketbrief {

/*!
 * Fetches the fixed indicator set (kIndicatorConfigs) for assets.
 *
 * Every (indicator, asset) pair is an independent task on the worker pool. A
 * failed or empty indicator is left out of the returned map; the remaining
 * series are unaffected. Full upstream series are cached per
 * (type, symbol, timeframe, period) and truncated on the way out.
 */
class IndicatorAggregator {
public:
    struct Options {
        std::chrono::seconds ttl{3600};
        int                  pointLimit = 12;
    };

    explicit IndicatorAggregator(std::shared_ptr<MarketDataProviderInterface> provider);
    IndicatorAggregator(std::shared_ptr<MarketDataProviderInterface> provider, Options options);

    //! Accepts a symbol string, a map carrying "symbol" or a ResolvedAsset. Fails with InvalidArgument otherwise.
    Result<IndicatorMap> fetchIndicators(const QVariant& ticker) const;
    IndicatorMap fetchIndicators(const ResolvedAsset& asset) const;
    //! Fans out all assets x indicators at once; result order follows `assets`.
    QVector<IndicatorMap> fetchIndicatorsForAssets(const QVector<ResolvedAsset>& assets) const;

    static std::optional<QString> normalizeTicker(const QVariant& ticker);
    static QString cacheKey(IndicatorType type, const QString& symbol, const QString& timeframe, int period);

    const Options& options() const { return m_options; }

    void setThreadPool(QThreadPool* pool);
    TtlCache<IndicatorSeries>& cacheForTesting() { return m_cache; }

private:
    QVector<IndicatorMap> fetchForSymbols(const QVector<QString>& symbols) const;
    std::optional<IndicatorSeries> fetchSeries(const QString& symbol, const IndicatorConfig& config) const;
    IndicatorSeries truncated(IndicatorSeries series) const;

    std::shared_ptr<MarketDataProviderInterface> m_provider;
    Options                                      m_options;
    mutable TtlCache<IndicatorSeries>            m_cache;
    QThreadPool*                                 m_threadPool = nullptr;
};

} // namespace marketbrief
