#include "ContextTypes.hpp"

#include <QPair>
#include <QSet>

namespace marketbrief {

QString rsiReadingName(RsiReading reading)
{
    switch (reading) {
    case RsiReading::Overbought:
        return QStringLiteral("overbought");
    case RsiReading::Oversold:
        return QStringLiteral("oversold");
    case RsiReading::Neutral:
        return QStringLiteral("neutral");
    }
    return {};
}

RsiReading rsiReadingFor(double value)
{
    if (value > 70.0) {
        return RsiReading::Overbought;
    }
    if (value < 30.0) {
        return RsiReading::Oversold;
    }
    return RsiReading::Neutral;
}

QString newsFeedName(NewsFeed feed)
{
    switch (feed) {
    case NewsFeed::Market:
        return QStringLiteral("market");
    case NewsFeed::Crypto:
        return QStringLiteral("crypto");
    }
    return {};
}

QVector<NewsItem> uniqueHeadlines(const QVector<NewsItem>& items, int limit)
{
    QVector<NewsItem> unique;
    if (limit <= 0) {
        return unique;
    }
    QSet<QPair<QString, QString>> seen;
    for (const NewsItem& item : items) {
        const QString headline = item.headline.trimmed();
        if (headline.isEmpty()) {
            continue;
        }
        const QPair<QString, QString> key{headline, item.date.trimmed()};
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        unique.append(item);
        if (unique.size() >= limit) {
            break;
        }
    }
    return unique;
}

} // namespace marketbrief
