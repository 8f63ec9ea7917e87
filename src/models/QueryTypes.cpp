#include "QueryTypes.hpp"

#include <QRegularExpression>

namespace marketbrief {

Query Query::fromText(const QString& text)
{
    static const QRegularExpression separators(QStringLiteral("[^a-z0-9]+"));

    Query query;
    query.m_text = text;
    query.m_normalized = text.simplified().toLower();
    const QStringList words = query.m_normalized.split(separators, Qt::SkipEmptyParts);
    for (const QString& word : words) {
        query.m_tokens.insert(word);
    }
    return query;
}

QString categoryName(Category category)
{
    switch (category) {
    case Category::Options:
        return QStringLiteral("options");
    case Category::DayTrading:
        return QStringLiteral("daytrading");
    case Category::Crypto:
        return QStringLiteral("crypto");
    case Category::Memecoin:
        return QStringLiteral("memecoin");
    case Category::Forex:
        return QStringLiteral("forex");
    case Category::Commodities:
        return QStringLiteral("commodities");
    case Category::Economic:
        return QStringLiteral("economic");
    case Category::Technical:
        return QStringLiteral("technical");
    case Category::MarketTrend:
        return QStringLiteral("market_trend");
    }
    return {};
}

} // namespace marketbrief
