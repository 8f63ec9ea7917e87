#pragma once

#include <QString>
#include <QStringList>

#include <optional>

#include "models/ContextTypes.hpp"
#include "models/IndicatorTypes.hpp"
#include "models/Result.hpp"

namespace marketbrief {

struct BellwetherProfile {
    QString symbol;
    QString name;
    QString descriptors;
};

//! Read-only access to persisted bellwether snapshots, the economic calendar and news headlines.
class AssetStoreInterface {
public:
    virtual ~AssetStoreInterface() = default;

    virtual Result<BellwetherProfile> bellwetherProfile(const QString& symbol) const = 0;
    virtual Result<IndicatorSeries> indicatorSnapshot(const QString& symbol, IndicatorType type) const = 0;
    virtual Result<EconomicCalendar> economicCalendar() const = 0;
    //! Most recent headlines first; may contain duplicates collected by overlapping refresh runs.
    virtual Result<QVector<NewsItem>> recentNews(NewsFeed feed) const = 0;
};

} // namespace marketbrief
