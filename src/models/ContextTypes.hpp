#pragma once

#include <QDate>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

#include "models/AssetTypes.hpp"
#include "models/IndicatorTypes.hpp"
#include "models/QueryTypes.hpp"

namespace marketbrief {

enum class RsiReading {
    Overbought,
    Oversold,
    Neutral,
};

QString rsiReadingName(RsiReading reading);
RsiReading rsiReadingFor(double value);

struct AssetContext {
    ResolvedAsset             asset;
    IndicatorMap              indicators;
    std::optional<RsiReading> rsiReading;
    std::optional<double>     latestRsi;
};

struct BellwetherEntry {
    QString                        symbol;
    QString                        name;
    QString                        descriptors;
    std::optional<IndicatorSeries> rsi;
    std::optional<IndicatorSeries> ema;
};

struct CalendarEvent {
    QString title;
    QString country;
    QString impact;
    QString time;
};

struct CalendarDay {
    QDate                  date;
    double                 volatilityScore = 0.0;
    QString                volatility;
    int                    numberOfEvents = 0;
    QVector<CalendarEvent> topEvents;
    bool                   isToday = false;
};

struct EconomicCalendar {
    QVector<CalendarDay> week;
    double               lowThreshold = 0.0;
    double               mediumThreshold = 0.0;
    double               highThreshold = 0.0;
};

enum class NewsFeed {
    Market,
    Crypto,
};

QString newsFeedName(NewsFeed feed);

struct NewsItem {
    QString headline;
    QString date;
    QString source;
    QString url;
};

//! First occurrence of each (headline, date) pair, in input order, at most `limit` items.
QVector<NewsItem> uniqueHeadlines(const QVector<NewsItem>& items, int limit);

//! Terminal artifact of one pipeline run. Absent sections are std::nullopt, never empty placeholders.
struct AggregatedContext {
    QString                                 queryText;
    QueryClassification                     classification;
    QVector<AssetContext>                   assets;
    QVector<ConflictReport>                 conflicts;
    std::optional<QVector<BellwetherEntry>> bellwethers;
    std::optional<EconomicCalendar>         calendar;
    std::optional<QVector<NewsItem>>        news;
    std::optional<QVector<NewsItem>>        cryptoNews;
    QStringList                             limitations;
    bool                                    degraded = false;

    bool requiresDisambiguation() const { return !conflicts.isEmpty(); }
};

} // namespace marketbrief
