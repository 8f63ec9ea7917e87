#pragma once

#include <QMap>
#include <QMetaType>
#include <QSet>
#include <QString>
#include <QVector>

namespace marketbrief {

//! Raw query text plus its lowercase word set. Immutable once built.
class Query {
public:
    Query() = default;
    static Query fromText(const QString& text);

    const QString& text() const { return m_text; }
    const QString& normalized() const { return m_normalized; }
    const QSet<QString>& tokens() const { return m_tokens; }
    bool isEmpty() const { return m_normalized.isEmpty(); }

private:
    QString       m_text;
    QString       m_normalized;
    QSet<QString> m_tokens;
};

enum class Category {
    Options,
    DayTrading,
    Crypto,
    Memecoin,
    Forex,
    Commodities,
    Economic,
    Technical,
    MarketTrend,
};

QString categoryName(Category category);

// Guidance key -> advisory text.
using RiskContext = QMap<QString, QString>;

struct QueryClassification {
    QVector<Category> categories;
    RiskContext       riskContext;
    bool              matchedAny = false;

    bool contains(Category category) const { return categories.contains(category); }
};

struct CandidateSymbol {
    enum class Origin {
        ContractAddress,
        DollarTicker,
        BareTicker,
        InstrumentName,
        Word,
    };

    QString text;
    Origin  origin = Origin::Word;
    double  confidence = 0.0;
    int     position = 0;

    bool isContractAddress() const { return origin == Origin::ContractAddress; }
    bool isMultiWord() const { return text.contains(QLatin1Char(' ')); }
};

} // namespace marketbrief

Q_DECLARE_METATYPE(marketbrief::QueryClassification)
