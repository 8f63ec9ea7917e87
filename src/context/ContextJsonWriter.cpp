#include "ContextJsonWriter.hpp"

#include <QJsonArray>

namespace marketbrief {

namespace {

QJsonArray categoriesToJson(const QVector<Category>& categories)
{
    QJsonArray array;
    for (Category category : categories) {
        array.append(categoryName(category));
    }
    return array;
}

QJsonObject riskContextToJson(const RiskContext& riskContext)
{
    QJsonObject object;
    for (auto it = riskContext.cbegin(); it != riskContext.cend(); ++it) {
        object.insert(it.key(), it.value());
    }
    return object;
}

QJsonObject calendarToJson(const EconomicCalendar& calendar)
{
    QJsonArray week;
    for (const CalendarDay& day : calendar.week) {
        QJsonArray events;
        for (const CalendarEvent& event : day.topEvents) {
            events.append(QJsonObject{
                {QStringLiteral("event"), event.title},
                {QStringLiteral("country"), event.country},
                {QStringLiteral("impact"), event.impact},
                {QStringLiteral("time"), event.time},
            });
        }
        week.append(QJsonObject{
            {QStringLiteral("date"), day.date.toString(Qt::ISODate)},
            {QStringLiteral("volatility_score"), day.volatilityScore},
            {QStringLiteral("volatility"), day.volatility},
            {QStringLiteral("number_of_events"), day.numberOfEvents},
            {QStringLiteral("top_events"), events},
            {QStringLiteral("is_today"), day.isToday},
        });
    }
    return QJsonObject{
        {QStringLiteral("week"), week},
        {QStringLiteral("thresholds"),
         QJsonObject{
             {QStringLiteral("low"), calendar.lowThreshold},
             {QStringLiteral("medium"), calendar.mediumThreshold},
             {QStringLiteral("high"), calendar.highThreshold},
         }},
    };
}

QJsonArray newsToJson(const QVector<NewsItem>& news)
{
    QJsonArray array;
    for (const NewsItem& item : news) {
        QJsonObject object{
            {QStringLiteral("headline"), item.headline},
            {QStringLiteral("date"), item.date},
            {QStringLiteral("source"), item.source},
        };
        if (!item.url.isEmpty()) {
            object.insert(QStringLiteral("url"), item.url);
        }
        array.append(object);
    }
    return array;
}

} // namespace

QJsonObject ContextJsonWriter::assetToJson(const ResolvedAsset& asset)
{
    return QJsonObject{
        {QStringLiteral("symbol"), asset.symbol},
        {QStringLiteral("name"), asset.name},
        {QStringLiteral("asset_class"), assetClassName(asset.assetClass)},
        {QStringLiteral("price"), asset.price},
        {QStringLiteral("change_percent"), asset.changePercent},
        {QStringLiteral("market_cap"), asset.marketCap},
        {QStringLiteral("volume"), asset.volume},
        {QStringLiteral("data_source"), asset.dataSource},
    };
}

QJsonObject ContextJsonWriter::seriesToJson(const IndicatorSeries& series)
{
    QJsonArray points;
    for (const IndicatorPoint& point : series.points) {
        points.append(QJsonObject{
            {QStringLiteral("date"), point.date.toUTC().toString(Qt::ISODate)},
            {QStringLiteral("value"), point.value},
            {QStringLiteral("timeframe"), point.timeframe},
            {QStringLiteral("period"), point.period},
        });
    }
    return QJsonObject{
        {QStringLiteral("type"), indicatorTypeName(series.type)},
        {QStringLiteral("timeframe"), series.timeframe},
        {QStringLiteral("period"), series.period},
        {QStringLiteral("points"), points},
    };
}

QJsonObject ContextJsonWriter::toJsonObject(const AggregatedContext& context)
{
    QJsonObject root;
    root.insert(QStringLiteral("query"), context.queryText);
    root.insert(QStringLiteral("classification"),
                QJsonObject{
                    {QStringLiteral("categories"), categoriesToJson(context.classification.categories)},
                    {QStringLiteral("risk_context"), riskContextToJson(context.classification.riskContext)},
                });

    QJsonArray assets;
    for (const AssetContext& assetContext : context.assets) {
        QJsonObject entry = assetToJson(assetContext.asset);
        QJsonObject indicators;
        for (auto it = assetContext.indicators.cbegin(); it != assetContext.indicators.cend(); ++it) {
            indicators.insert(indicatorTypeKey(it.key()), seriesToJson(it.value()));
        }
        entry.insert(QStringLiteral("indicators"), indicators);
        if (assetContext.rsiReading && assetContext.latestRsi) {
            entry.insert(QStringLiteral("rsi_reading"), rsiReadingName(*assetContext.rsiReading));
            entry.insert(QStringLiteral("latest_rsi"), *assetContext.latestRsi);
        }
        assets.append(entry);
    }
    root.insert(QStringLiteral("assets"), assets);

    if (!context.conflicts.isEmpty()) {
        QJsonArray conflicts;
        for (const ConflictReport& conflict : context.conflicts) {
            QJsonArray matches;
            for (const ResolvedAsset& match : conflict.matches) {
                matches.append(assetToJson(match));
            }
            conflicts.append(QJsonObject{
                {QStringLiteral("candidate"), conflict.candidate},
                {QStringLiteral("matches"), matches},
            });
        }
        root.insert(QStringLiteral("conflicts"), conflicts);
        root.insert(QStringLiteral("requires_disambiguation"), true);
    }

    if (context.bellwethers) {
        QJsonArray bellwethers;
        for (const BellwetherEntry& entry : *context.bellwethers) {
            QJsonObject object{
                {QStringLiteral("symbol"), entry.symbol},
                {QStringLiteral("name"), entry.name},
                {QStringLiteral("descriptors"), entry.descriptors},
            };
            if (entry.rsi) {
                object.insert(QStringLiteral("rsi"), seriesToJson(*entry.rsi));
            }
            if (entry.ema) {
                object.insert(QStringLiteral("ema"), seriesToJson(*entry.ema));
            }
            bellwethers.append(object);
        }
        root.insert(QStringLiteral("bellwethers"), bellwethers);
    }

    if (context.calendar) {
        root.insert(QStringLiteral("economic_calendar"), calendarToJson(*context.calendar));
    }
    if (context.news) {
        root.insert(QStringLiteral("news"), newsToJson(*context.news));
    }
    if (context.cryptoNews) {
        root.insert(QStringLiteral("crypto_news"), newsToJson(*context.cryptoNews));
    }

    if (!context.limitations.isEmpty()) {
        root.insert(QStringLiteral("limitations"), QJsonArray::fromStringList(context.limitations));
    }
    if (context.degraded) {
        root.insert(QStringLiteral("degraded"), true);
    }
    return root;
}

QByteArray ContextJsonWriter::toJson(const AggregatedContext& context, QJsonDocument::JsonFormat format)
{
    return QJsonDocument(toJsonObject(context)).toJson(format);
}

} // namespace marketbrief
