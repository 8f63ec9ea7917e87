#pragma once

#include <QSet>
#include <QStringList>
#include <QVector>

#include "models/QueryTypes.hpp"

namespace marketbrief {

/*!
 * Deterministic extraction of candidate symbols from query text.
 *
 * Recognizes contract addresses, `$`-prefixed tickers, uppercase bare tickers,
 * multi-word instrument names and remaining non-stopword words, in that order
 * of confidence. Generic nouns ("token", "coin", ...) are removed from a name
 * only when a word longer than three characters remains.
 */
class SymbolExtractor {
public:
    static constexpr int kDefaultMaxCandidates = 4;

    explicit SymbolExtractor(int maxCandidates = kDefaultMaxCandidates);

    QVector<CandidateSymbol> extract(const Query& query) const;

    static QStringList texts(const QVector<CandidateSymbol>& candidates);
    //! "Venice token" -> "Venice", "Ape coin" -> "Ape coin".
    static QString stripFillerWords(const QString& phrase);

    static bool isFillerWord(const QString& word);
    static bool isStopword(const QString& word);

    int maxCandidates() const { return m_maxCandidates; }

private:
    int m_maxCandidates;
};

} // namespace marketbrief
