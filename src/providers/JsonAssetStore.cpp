#include "JsonAssetStore.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <algorithm>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcAssetStore, "marketbrief.store.json")

namespace marketbrief {

namespace {

QDateTime parseTimestamp(const QString& value)
{
    QDateTime parsed = QDateTime::fromString(value, Qt::ISODate);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, QStringLiteral("yyyy-MM-dd HH:mm:ss"));
    }
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(value, QStringLiteral("yyyy-MM-dd"));
    }
    if (parsed.isValid() && parsed.timeSpec() == Qt::LocalTime) {
        parsed.setTimeSpec(Qt::UTC);
    }
    return parsed;
}

IndicatorSeries parseSeries(IndicatorType type, const QJsonArray& array)
{
    const IndicatorConfig& config = indicatorConfigFor(type);
    IndicatorSeries series;
    series.type = type;
    series.timeframe = QString::fromLatin1(config.timeframe);
    series.period = config.period;

    const QString valueKey = indicatorTypeKey(type);
    for (const QJsonValue& entry : array) {
        const QJsonObject object = entry.toObject();
        const QDateTime date = parseTimestamp(object.value(QStringLiteral("date")).toString());
        // Eksporty FMP trzymają wartość pod nazwą wskaźnika ("rsi": 55.2), nowsze pod "value".
        const QJsonValue raw = object.contains(QStringLiteral("value")) ? object.value(QStringLiteral("value"))
                                                                        : object.value(valueKey);
        if (!date.isValid() || !raw.isDouble()) {
            continue;
        }
        series.points.append({date, raw.toDouble(), series.timeframe, series.period});
    }
    std::stable_sort(series.points.begin(), series.points.end(), [](const IndicatorPoint& lhs, const IndicatorPoint& rhs) {
        return lhs.date > rhs.date;
    });
    return series;
}

} // namespace

JsonAssetStore::JsonAssetStore() = default;

JsonAssetStore::~JsonAssetStore() = default;

bool JsonAssetStore::loadFromFile(const QString& path, QString* errorMessage)
{
    const QString resolved = utils::expandPath(path);
    QFile file(resolved);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Nie można otworzyć pliku snapshotów: %1").arg(resolved);
        }
        qCWarning(lcAssetStore) << "Nie można otworzyć pliku snapshotów" << resolved << file.errorString();
        return false;
    }
    return loadFromJson(file.readAll(), errorMessage);
}

bool JsonAssetStore::loadFromJson(const QByteArray& json, QString* errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Niepoprawny JSON snapshotów: %1").arg(parseError.errorString());
        }
        qCWarning(lcAssetStore) << "Niepoprawny JSON snapshotów" << parseError.errorString();
        return false;
    }

    const QJsonObject root = document.object();
    QHash<QString, BellwetherRecord> bellwethers;
    const QJsonArray assets = root.value(QStringLiteral("bellwethers")).toArray();
    for (const QJsonValue& value : assets) {
        BellwetherRecord record = parseBellwether(value.toObject());
        if (record.profile.symbol.isEmpty()) {
            continue;
        }
        bellwethers.insert(record.profile.symbol.toUpper(), record);
    }

    std::optional<EconomicCalendar> calendar;
    if (root.value(QStringLiteral("economic_calendar")).isObject()) {
        calendar = parseCalendar(root.value(QStringLiteral("economic_calendar")).toObject());
    }

    QVector<NewsItem> marketNews = parseNews(root.value(QStringLiteral("news")).toArray());
    QVector<NewsItem> cryptoNews = parseNews(root.value(QStringLiteral("crypto_news")).toArray());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_bellwethers = std::move(bellwethers);
    m_calendar = std::move(calendar);
    m_marketNews = std::move(marketNews);
    m_cryptoNews = std::move(cryptoNews);
    qCInfo(lcAssetStore) << "Wczytano" << m_bellwethers.size() << "aktywów bellwether," << m_marketNews.size()
                         << "wiadomości rynkowych i" << m_cryptoNews.size() << "wiadomości krypto";
    return true;
}

Result<BellwetherProfile> JsonAssetStore::bellwetherProfile(const QString& symbol) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_bellwethers.constFind(symbol.trimmed().toUpper());
    if (it == m_bellwethers.constEnd()) {
        return Result<BellwetherProfile>::failure(ErrorKind::NotFound,
                                                  QStringLiteral("Brak aktywa bellwether %1").arg(symbol));
    }
    return Result<BellwetherProfile>::success(it->profile);
}

Result<IndicatorSeries> JsonAssetStore::indicatorSnapshot(const QString& symbol, IndicatorType type) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_bellwethers.constFind(symbol.trimmed().toUpper());
    if (it == m_bellwethers.constEnd()) {
        return Result<IndicatorSeries>::failure(ErrorKind::NotFound);
    }
    const auto snapshot = it->snapshots.constFind(indicatorTypeName(type));
    if (snapshot == it->snapshots.constEnd() || snapshot->isEmpty()) {
        return Result<IndicatorSeries>::failure(ErrorKind::NotFound);
    }
    return Result<IndicatorSeries>::success(*snapshot);
}

Result<EconomicCalendar> JsonAssetStore::economicCalendar() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_calendar || m_calendar->week.isEmpty()) {
        return Result<EconomicCalendar>::failure(ErrorKind::NotFound,
                                                 QStringLiteral("Brak danych kalendarza ekonomicznego"));
    }
    return Result<EconomicCalendar>::success(*m_calendar);
}

Result<QVector<NewsItem>> JsonAssetStore::recentNews(NewsFeed feed) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const QVector<NewsItem>& news = feed == NewsFeed::Crypto ? m_cryptoNews : m_marketNews;
    if (news.isEmpty()) {
        return Result<QVector<NewsItem>>::failure(ErrorKind::NotFound,
                                                  QStringLiteral("Brak wiadomości (%1)").arg(newsFeedName(feed)));
    }
    return Result<QVector<NewsItem>>::success(news);
}

int JsonAssetStore::bellwetherCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_bellwethers.size());
}

JsonAssetStore::BellwetherRecord JsonAssetStore::parseBellwether(const QJsonObject& object)
{
    BellwetherRecord record;
    record.profile.symbol = object.value(QStringLiteral("symbol")).toString().trimmed();
    record.profile.name = object.value(QStringLiteral("name")).toString();
    record.profile.descriptors = object.value(QStringLiteral("descriptors")).toString();

    const QJsonObject indicators = object.value(QStringLiteral("indicators")).toObject();
    for (auto it = indicators.begin(); it != indicators.end(); ++it) {
        const auto type = indicatorTypeFromName(it.key());
        if (!type) {
            qCDebug(lcAssetStore) << "Pomijam nieznany wskaźnik" << it.key() << "dla" << record.profile.symbol;
            continue;
        }
        record.snapshots.insert(indicatorTypeName(*type), parseSeries(*type, it->toArray()));
    }
    return record;
}

EconomicCalendar JsonAssetStore::parseCalendar(const QJsonObject& object)
{
    EconomicCalendar calendar;
    const QJsonObject thresholds = object.value(QStringLiteral("thresholds")).toObject();
    calendar.lowThreshold = thresholds.value(QStringLiteral("low")).toDouble();
    calendar.mediumThreshold = thresholds.value(QStringLiteral("medium")).toDouble();
    calendar.highThreshold = thresholds.value(QStringLiteral("high")).toDouble();

    const QJsonArray week = object.value(QStringLiteral("week")).toArray();
    for (const QJsonValue& value : week) {
        const QJsonObject dayObject = value.toObject();
        CalendarDay day;
        day.date = QDate::fromString(dayObject.value(QStringLiteral("date")).toString(), Qt::ISODate);
        if (!day.date.isValid()) {
            continue;
        }
        day.volatilityScore = dayObject.value(QStringLiteral("volatility_score")).toDouble();
        day.volatility = dayObject.value(QStringLiteral("volatility")).toString();
        day.numberOfEvents = dayObject.value(QStringLiteral("number_of_events")).toInt();
        const QJsonArray events = dayObject.value(QStringLiteral("top_events")).toArray();
        for (const QJsonValue& eventValue : events) {
            const QJsonObject eventObject = eventValue.toObject();
            CalendarEvent event;
            event.title = eventObject.value(QStringLiteral("event")).toString();
            event.country = eventObject.value(QStringLiteral("country")).toString();
            event.impact = eventObject.value(QStringLiteral("impact")).toString();
            event.time = eventObject.value(QStringLiteral("time")).toString();
            day.topEvents.append(event);
        }
        calendar.week.append(day);
    }
    std::sort(calendar.week.begin(), calendar.week.end(), [](const CalendarDay& lhs, const CalendarDay& rhs) {
        return lhs.date < rhs.date;
    });
    return calendar;
}

QVector<NewsItem> JsonAssetStore::parseNews(const QJsonArray& array)
{
    QVector<NewsItem> news;
    news.reserve(array.size());
    for (const QJsonValue& value : array) {
        const QJsonObject object = value.toObject();
        NewsItem item;
        item.headline = object.value(QStringLiteral("headline")).toString().trimmed();
        item.date = object.value(QStringLiteral("date")).toString().trimmed();
        item.source = object.value(QStringLiteral("source")).toString();
        item.url = object.value(QStringLiteral("url")).toString();
        if (item.headline.isEmpty()) {
            continue;
        }
        news.append(item);
    }
    return news;
}

} // namespace marketbrief
