#pragma once

#include <QDateTime>
#include <QString>
#include <QVector>

#include <functional>
#include <optional>

#include "models/AssetTypes.hpp"
#include "models/ContextTypes.hpp"
#include "models/QueryTypes.hpp"

namespace marketbrief {

struct AssemblyInput {
    QString                                 queryText;
    QueryClassification                     classification;
    ResolutionResult                        resolution;
    QVector<IndicatorMap>                   indicatorsByAsset; // aligned with resolution.assets
    std::optional<QVector<BellwetherEntry>> bellwethers;
    std::optional<EconomicCalendar>         calendar;
    std::optional<QVector<NewsItem>>        news;
    std::optional<QVector<NewsItem>>        cryptoNews;
};

/*!
 * Merges the pipeline stages into one AggregatedContext.
 *
 * assemble() never throws. Every resolved asset is kept, with or without
 * indicators, RSI readings are computed here, and optional sections stay
 * std::nullopt when their source had nothing.
 */
class ContextAssembler {
public:
    using Clock = std::function<QDateTime()>;

    ContextAssembler();

    AggregatedContext assemble(const AssemblyInput& input) const;

    static AggregatedContext minimalContext(const QString& queryText, const QueryClassification& classification);

    void setClockForTesting(Clock clock);

private:
    AggregatedContext assembleUnchecked(const AssemblyInput& input) const;
    static AssetContext buildAssetContext(const ResolvedAsset& asset, const IndicatorMap& indicators);

    Clock m_clock;
};

} // namespace marketbrief
