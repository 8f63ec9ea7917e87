#include "IndicatorAggregator.hpp"

#include <QFuture>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QThreadPool>
#include <QVariantHash>
#include <QVariantMap>
#include <QtConcurrent>

#include <algorithm>
#include <utility>

#include "resolve/SymbolNormalizer.hpp"

Q_LOGGING_CATEGORY(lcIndicatorAggregator, "marketbrief.indicators")

namespace marketbrief {

namespace {

std::optional<QString> sanitizeSymbol(const QString& raw)
{
    static const QRegularExpression pattern(QStringLiteral("^[A-Z0-9][A-Z0-9./\\-]{0,19}$"));
    const QString upper = raw.trimmed().toUpper();
    if (!pattern.match(upper).hasMatch()) {
        return std::nullopt;
    }
    return upper;
}

} // namespace

IndicatorAggregator::IndicatorAggregator(std::shared_ptr<MarketDataProviderInterface> provider)
    : IndicatorAggregator(std::move(provider), Options{})
{
}

IndicatorAggregator::IndicatorAggregator(std::shared_ptr<MarketDataProviderInterface> provider, Options options)
    : m_provider(std::move(provider))
    , m_options(options)
    , m_cache(options.ttl)
{
}

void IndicatorAggregator::setThreadPool(QThreadPool* pool)
{
    m_threadPool = pool;
}

std::optional<QString> IndicatorAggregator::normalizeTicker(const QVariant& ticker)
{
    if (!ticker.isValid() || ticker.isNull()) {
        return std::nullopt;
    }
    if (ticker.metaType() == QMetaType::fromType<ResolvedAsset>()) {
        return sanitizeSymbol(indicatorSymbolFor(ticker.value<ResolvedAsset>()));
    }
    switch (ticker.typeId()) {
    case QMetaType::QString:
    case QMetaType::QByteArray:
        return sanitizeSymbol(ticker.toString());
    case QMetaType::QVariantMap:
        return normalizeTicker(ticker.toMap().value(QStringLiteral("symbol")));
    case QMetaType::QVariantHash:
        return normalizeTicker(ticker.toHash().value(QStringLiteral("symbol")));
    default:
        break;
    }
    return std::nullopt;
}

QString IndicatorAggregator::cacheKey(IndicatorType type, const QString& symbol, const QString& timeframe, int period)
{
    return QStringLiteral("indicator:%1:%2:%3:%4")
        .arg(indicatorTypeName(type), symbol.trimmed().toUpper(), timeframe)
        .arg(period);
}

Result<IndicatorMap> IndicatorAggregator::fetchIndicators(const QVariant& ticker) const
{
    const auto symbol = normalizeTicker(ticker);
    if (!symbol) {
        qCWarning(lcIndicatorAggregator) << "Nie można ustalić symbolu wskaźników z" << ticker;
        return Result<IndicatorMap>::failure(ErrorKind::InvalidArgument,
                                             QStringLiteral("Nieobsługiwany identyfikator aktywa"));
    }
    return Result<IndicatorMap>::success(fetchForSymbols({*symbol}).constFirst());
}

IndicatorMap IndicatorAggregator::fetchIndicators(const ResolvedAsset& asset) const
{
    return fetchIndicatorsForAssets({asset}).constFirst();
}

QVector<IndicatorMap> IndicatorAggregator::fetchIndicatorsForAssets(const QVector<ResolvedAsset>& assets) const
{
    QVector<QString> symbols;
    symbols.reserve(assets.size());
    for (const ResolvedAsset& asset : assets) {
        symbols.append(sanitizeSymbol(indicatorSymbolFor(asset)).value_or(QString()));
    }
    return fetchForSymbols(symbols);
}

QVector<IndicatorMap> IndicatorAggregator::fetchForSymbols(const QVector<QString>& symbols) const
{
    QThreadPool* pool = m_threadPool ? m_threadPool : QThreadPool::globalInstance();

    struct PendingFetch {
        int                                   assetIndex;
        IndicatorType                         type;
        QFuture<std::optional<IndicatorSeries>> future;
    };

    QVector<PendingFetch> pending;
    for (int index = 0; index < symbols.size(); ++index) {
        const QString symbol = symbols.at(index);
        if (symbol.isEmpty()) {
            qCWarning(lcIndicatorAggregator) << "Pomijam wskaźniki dla aktywa bez poprawnego symbolu";
            continue;
        }
        for (const IndicatorConfig& config : kIndicatorConfigs) {
            pending.append({index, config.type, QtConcurrent::run(pool, [this, symbol, config]() {
                                return fetchSeries(symbol, config);
                            })});
        }
    }

    QVector<IndicatorMap> maps(symbols.size());
    for (PendingFetch& fetch : pending) {
        fetch.future.waitForFinished();
        const std::optional<IndicatorSeries> series = fetch.future.result();
        if (series) {
            maps[fetch.assetIndex].insert(fetch.type, truncated(*series));
        }
    }
    for (int index = 0; index < maps.size(); ++index) {
        if (!symbols.at(index).isEmpty() && maps.at(index).size() < static_cast<int>(kIndicatorConfigs.size())) {
            qCInfo(lcIndicatorAggregator) << "Niepełny zestaw wskaźników dla" << symbols.at(index) << "-"
                                          << maps.at(index).size() << "z" << kIndicatorConfigs.size();
        }
    }
    return maps;
}

std::optional<IndicatorSeries> IndicatorAggregator::fetchSeries(const QString& symbol,
                                                                const IndicatorConfig& config) const
{
    const QString timeframe = QString::fromLatin1(config.timeframe);
    const QString key = cacheKey(config.type, symbol, timeframe, config.period);
    if (auto cached = m_cache.get(key)) {
        return cached;
    }
    if (!m_provider) {
        return std::nullopt;
    }

    const IndicatorFetch fetch = m_provider->fetchIndicator(symbol, config.type, timeframe, config.period);
    if (!fetch.ok()) {
        qCWarning(lcIndicatorAggregator) << "Pobranie" << indicatorTypeName(config.type) << "dla" << symbol
                                         << "nie powiodło się -" << errorKindName(fetch.error()) << fetch.errorMessage();
        return std::nullopt;
    }
    if (fetch.value().isEmpty()) {
        qCDebug(lcIndicatorAggregator) << "Brak punktów" << indicatorTypeName(config.type) << "dla" << symbol;
        return std::nullopt;
    }

    IndicatorSeries series;
    series.type = config.type;
    series.timeframe = timeframe;
    series.period = config.period;
    series.points = fetch.value();
    for (IndicatorPoint& point : series.points) {
        point.timeframe = timeframe;
        point.period = config.period;
    }
    std::stable_sort(series.points.begin(), series.points.end(), [](const IndicatorPoint& lhs, const IndicatorPoint& rhs) {
        return lhs.date > rhs.date;
    });
    m_cache.put(key, series);
    return series;
}

IndicatorSeries IndicatorAggregator::truncated(IndicatorSeries series) const
{
    if (m_options.pointLimit > 0 && series.points.size() > m_options.pointLimit) {
        series.points.resize(m_options.pointLimit);
    }
    return series;
}

} // namespace marketbrief
