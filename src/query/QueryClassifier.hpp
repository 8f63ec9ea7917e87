#pragma once

#include <QStringList>
#include <QVector>

#include "models/QueryTypes.hpp"

namespace marketbrief {

//! Fixed priority used to pick the active RiskContext, highest first.
const QVector<Category>& categoryPriority();

RiskContext riskContextFor(Category category);
RiskContext defaultRiskContext();

class QueryClassifier {
public:
    struct Rule {
        Category    category;
        QStringList primaryTerms;   // substrings of the normalized query
        QStringList secondaryTerms; // whole tokens only
    };

    QueryClassifier();

    QueryClassification classify(const Query& query) const;

    const QVector<Rule>& rules() const { return m_rules; }

private:
    bool matches(const Rule& rule, const Query& query) const;

    QVector<Rule> m_rules;
};

} // namespace marketbrief
