#include "BellwetherSelector.hpp"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcBellwethers, "marketbrief.context.bellwethers")

namespace marketbrief {

BellwetherSelector::BellwetherSelector(std::shared_ptr<AssetStoreInterface> store, int pointLimit)
    : m_store(std::move(store))
    , m_pointLimit(pointLimit)
{
}

QStringList BellwetherSelector::symbolsFor(Category category)
{
    switch (category) {
    case Category::Options:
        return {QStringLiteral("SPY"), QStringLiteral("QQQ"), QStringLiteral("VIX")};
    case Category::DayTrading:
        return {QStringLiteral("SPY"), QStringLiteral("QQQ"), QStringLiteral("IWM")};
    case Category::Crypto:
        return {QStringLiteral("BTC"), QStringLiteral("ETH"), QStringLiteral("SOL")};
    case Category::Memecoin:
        return {QStringLiteral("BTC"), QStringLiteral("DOGE"), QStringLiteral("SOL")};
    case Category::Forex:
        return {QStringLiteral("DXY"), QStringLiteral("EURUSD"), QStringLiteral("USDJPY")};
    case Category::Commodities:
        return {QStringLiteral("GLD"), QStringLiteral("USO"), QStringLiteral("DXY")};
    case Category::Economic:
        return {QStringLiteral("SPY"), QStringLiteral("TLT"), QStringLiteral("DXY")};
    case Category::Technical:
        return {QStringLiteral("SPY"), QStringLiteral("QQQ")};
    case Category::MarketTrend:
        return {QStringLiteral("SPY"), QStringLiteral("QQQ"), QStringLiteral("BTC")};
    }
    return defaultSymbols();
}

QStringList BellwetherSelector::defaultSymbols()
{
    return {QStringLiteral("SPY"), QStringLiteral("QQQ"), QStringLiteral("BTC")};
}

QStringList BellwetherSelector::symbolsFor(const QueryClassification& classification)
{
    if (classification.categories.isEmpty()) {
        return defaultSymbols();
    }
    QStringList symbols;
    for (Category category : classification.categories) {
        for (const QString& symbol : symbolsFor(category)) {
            if (!symbols.contains(symbol)) {
                symbols.append(symbol);
            }
            if (symbols.size() == kMaxBellwethers) {
                return symbols;
            }
        }
    }
    return symbols;
}

std::optional<QVector<BellwetherEntry>> BellwetherSelector::select(const QueryClassification& classification) const
{
    if (!m_store) {
        return std::nullopt;
    }

    QVector<BellwetherEntry> entries;
    for (const QString& symbol : symbolsFor(classification)) {
        BellwetherEntry entry;
        entry.symbol = symbol;
        const Result<BellwetherProfile> profile = m_store->bellwetherProfile(symbol);
        if (profile.ok()) {
            entry.name = profile.value().name;
            entry.descriptors = profile.value().descriptors;
        } else {
            entry.name = symbol;
        }
        entry.rsi = snapshot(symbol, IndicatorType::Rsi);
        entry.ema = snapshot(symbol, IndicatorType::Ema);
        if (!entry.rsi && !entry.ema) {
            qCDebug(lcBellwethers) << "Brak snapshotów dla bellwether" << symbol;
            continue;
        }
        entries.append(entry);
    }

    if (entries.isEmpty()) {
        return std::nullopt;
    }
    return entries;
}

std::optional<IndicatorSeries> BellwetherSelector::snapshot(const QString& symbol, IndicatorType type) const
{
    Result<IndicatorSeries> series = m_store->indicatorSnapshot(symbol, type);
    if (!series.ok()) {
        if (series.error() != ErrorKind::NotFound) {
            qCWarning(lcBellwethers) << "Odczyt snapshotu" << indicatorTypeName(type) << "dla" << symbol
                                     << "nie powiódł się -" << series.errorMessage();
        }
        return std::nullopt;
    }
    if (series.value().isEmpty()) {
        return std::nullopt;
    }
    IndicatorSeries trimmed = series.value();
    if (m_pointLimit > 0 && trimmed.points.size() > m_pointLimit) {
        trimmed.points.resize(m_pointLimit);
    }
    return trimmed;
}

} // namespace marketbrief
