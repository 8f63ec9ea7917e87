#include "SymbolExtractor.hpp"

#include <QLoggingCategory>
#include <QRegularExpression>

#include <algorithm>

Q_LOGGING_CATEGORY(lcSymbolExtractor, "marketbrief.query.extractor")

namespace marketbrief {

namespace {

constexpr double kContractConfidence = 1.0;
constexpr double kDollarConfidence = 0.95;
constexpr double kBareTickerConfidence = 0.9;
constexpr double kNameConfidence = 0.8;
constexpr double kCapitalizedNameConfidence = 0.75;
constexpr double kWordConfidence = 0.5;
constexpr int kMaxNameWords = 3;
constexpr int kMaxWordLength = 10;

struct Word {
    QString text;
    int     position = 0;
    bool    dollar = false;
    bool    consumed = false;
};

const QSet<QString>& fillerWords()
{
    static const QSet<QString> words{
        QStringLiteral("token"),
        QStringLiteral("tokens"),
        QStringLiteral("coin"),
        QStringLiteral("coins"),
        QStringLiteral("crypto"),
        QStringLiteral("cryptocurrency"),
    };
    return words;
}

const QSet<QString>& stopwords()
{
    static const QSet<QString> words{
        // pytania i słowa funkcyjne
        QStringLiteral("a"), QStringLiteral("i"), QStringLiteral("me"), QStringLiteral("my"),
        QStringLiteral("we"), QStringLiteral("you"), QStringLiteral("it"), QStringLiteral("its"),
        QStringLiteral("the"), QStringLiteral("is"), QStringLiteral("are"), QStringLiteral("was"),
        QStringLiteral("were"), QStringLiteral("be"), QStringLiteral("been"), QStringLiteral("being"),
        QStringLiteral("to"), QStringLiteral("of"), QStringLiteral("and"), QStringLiteral("in"),
        QStringLiteral("that"), QStringLiteral("have"), QStringLiteral("had"), QStringLiteral("has"),
        QStringLiteral("for"), QStringLiteral("not"), QStringLiteral("on"), QStringLiteral("with"),
        QStringLiteral("as"), QStringLiteral("do"), QStringLiteral("does"), QStringLiteral("did"),
        QStringLiteral("by"), QStringLiteral("but"), QStringLiteral("from"), QStringLiteral("or"),
        QStringLiteral("an"), QStringLiteral("this"), QStringLiteral("these"), QStringLiteral("those"),
        QStringLiteral("their"), QStringLiteral("at"), QStringLiteral("so"), QStringLiteral("if"),
        QStringLiteral("about"), QStringLiteral("should"), QStringLiteral("would"), QStringLiteral("could"),
        QStringLiteral("can"), QStringLiteral("will"), QStringLiteral("into"), QStringLiteral("may"),
        QStringLiteral("might"), QStringLiteral("what"), QStringLiteral("whats"), QStringLiteral("how"),
        QStringLiteral("hows"), QStringLiteral("why"), QStringLiteral("who"), QStringLiteral("when"),
        QStringLiteral("where"), QStringLiteral("which"), QStringLiteral("here"), QStringLiteral("there"),
        QStringLiteral("any"), QStringLiteral("all"), QStringLiteral("get"), QStringLiteral("give"),
        QStringLiteral("show"), QStringLiteral("tell"), QStringLiteral("please"), QStringLiteral("think"),
        QStringLiteral("like"), QStringLiteral("love"), QStringLiteral("hate"), QStringLiteral("want"),
        QStringLiteral("need"), QStringLiteral("help"), QStringLiteral("look"), QStringLiteral("looking"),
        QStringLiteral("doing"), QStringLiteral("going"), QStringLiteral("seems"), QStringLiteral("come"),
        QStringLiteral("good"), QStringLiteral("bad"), QStringLiteral("new"), QStringLiteral("old"),
        QStringLiteral("big"), QStringLiteral("high"), QStringLiteral("low"), QStringLiteral("best"),
        QStringLiteral("worst"), QStringLiteral("today"), QStringLiteral("now"), QStringLiteral("right"),
        QStringLiteral("than"), QStringLiteral("vs"), QStringLiteral("versus"), QStringLiteral("or"),
        // handel
        QStringLiteral("long"), QStringLiteral("short"), QStringLiteral("buy"), QStringLiteral("sell"),
        QStringLiteral("hold"), QStringLiteral("trade"), QStringLiteral("trading"), QStringLiteral("invest"),
        QStringLiteral("price"), QStringLiteral("prices"), QStringLiteral("stock"), QStringLiteral("stocks"),
        QStringLiteral("share"), QStringLiteral("shares"), QStringLiteral("ticker"), QStringLiteral("market"),
        QStringLiteral("markets"), QStringLiteral("analysis"), QStringLiteral("analyze"), QStringLiteral("outlook"),
        QStringLiteral("chart"), QStringLiteral("news"), QStringLiteral("latest"), QStringLiteral("current"),
        QStringLiteral("currently"), QStringLiteral("level"), QStringLiteral("levels"), QStringLiteral("entry"),
        QStringLiteral("exit"), QStringLiteral("target"), QStringLiteral("support"), QStringLiteral("resistance"),
        QStringLiteral("trend"), QStringLiteral("bullish"), QStringLiteral("bearish"), QStringLiteral("week"),
        QStringLiteral("month"), QStringLiteral("year"), QStringLiteral("day"), QStringLiteral("usd"),
        // wskaźniki
        QStringLiteral("rsi"), QStringLiteral("ema"), QStringLiteral("sma"), QStringLiteral("dema"),
        QStringLiteral("macd"), QStringLiteral("technical"), QStringLiteral("technicals"),
        QStringLiteral("indicator"), QStringLiteral("indicators"),
    };
    return words;
}

bool hasLetter(const QString& text)
{
    return std::any_of(text.cbegin(), text.cend(), [](QChar ch) { return ch.isLetter(); });
}

bool isUppercaseTicker(const QString& word)
{
    if (word.size() < 1 || word.size() > kMaxWordLength || !hasLetter(word)) {
        return false;
    }
    for (const QChar ch : word) {
        if (ch.isLetter() && !ch.isUpper()) {
            return false;
        }
    }
    return true;
}

bool isCapitalized(const QString& word)
{
    return word.size() > 1 && word.at(0).isUpper() && word.mid(1).toLower() == word.mid(1);
}

QVector<Word> tokenize(const QString& text)
{
    static const QRegularExpression wordPattern(QStringLiteral("\\$?[A-Za-z0-9]+(?:[./][A-Za-z0-9]+)*"));

    QVector<Word> words;
    auto it = wordPattern.globalMatch(text);
    while (it.hasNext()) {
        const auto match = it.next();
        Word word;
        word.text = match.captured(0);
        word.position = static_cast<int>(match.capturedStart(0));
        if (word.text.startsWith(QLatin1Char('$'))) {
            word.dollar = true;
            word.text.remove(0, 1);
        }
        if (!word.text.isEmpty()) {
            words.append(word);
        }
    }
    return words;
}

bool isNameWord(const Word& word)
{
    const QString lower = word.text.toLower();
    return !word.dollar && !word.consumed && hasLetter(word.text) && !SymbolExtractor::isStopword(lower)
        && !SymbolExtractor::isFillerWord(lower);
}

} // namespace

SymbolExtractor::SymbolExtractor(int maxCandidates)
    : m_maxCandidates(qMax(1, maxCandidates))
{
}

bool SymbolExtractor::isFillerWord(const QString& word)
{
    return fillerWords().contains(word.toLower());
}

bool SymbolExtractor::isStopword(const QString& word)
{
    return stopwords().contains(word.toLower());
}

QString SymbolExtractor::stripFillerWords(const QString& phrase)
{
    const QStringList words = phrase.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    QStringList remaining;
    for (const QString& word : words) {
        if (!isFillerWord(word)) {
            remaining.append(word);
        }
    }
    const bool keepsSignal = std::any_of(remaining.cbegin(), remaining.cend(), [](const QString& word) {
        return word.size() > 3;
    });
    if (remaining.isEmpty() || !keepsSignal) {
        return phrase.simplified();
    }
    return remaining.join(QLatin1Char(' '));
}

QStringList SymbolExtractor::texts(const QVector<CandidateSymbol>& candidates)
{
    QStringList result;
    result.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        result.append(candidate.text);
    }
    return result;
}

QVector<CandidateSymbol> SymbolExtractor::extract(const Query& query) const
{
    static const QRegularExpression contractPattern(QStringLiteral("0x[a-fA-F0-9]{40}"));

    QVector<CandidateSymbol> found;
    const QString text = query.text();
    if (query.isEmpty()) {
        return found;
    }

    auto contracts = contractPattern.globalMatch(text);
    while (contracts.hasNext()) {
        const auto match = contracts.next();
        found.append({match.captured(0), CandidateSymbol::Origin::ContractAddress, kContractConfidence,
                      static_cast<int>(match.capturedStart(0))});
    }

    QVector<Word> words = tokenize(text);
    for (Word& word : words) {
        if (contractPattern.match(word.text).hasMatch()) {
            word.consumed = true;
        }
    }

    for (Word& word : words) {
        if (word.consumed || !word.dollar || !hasLetter(word.text)) {
            continue;
        }
        word.consumed = true;
        found.append({word.text.toUpper(), CandidateSymbol::Origin::DollarTicker, kDollarConfidence, word.position});
    }

    // Nazwy wielowyrazowe zakończone rzeczownikiem ogólnym ("Venice token", "magnify cash coin").
    for (int i = 0; i < words.size(); ++i) {
        if (words.at(i).consumed || words.at(i).dollar || !isFillerWord(words.at(i).text)) {
            continue;
        }
        int start = i;
        while (start > 0 && i - start < kMaxNameWords && isNameWord(words.at(start - 1))) {
            --start;
        }
        if (start == i) {
            continue;
        }
        QStringList phrase;
        for (int j = start; j <= i; ++j) {
            phrase.append(words.at(j).text);
            words[j].consumed = true;
        }
        found.append({stripFillerWords(phrase.join(QLatin1Char(' '))), CandidateSymbol::Origin::InstrumentName,
                      kNameConfidence, words.at(start).position});
    }

    // Sekwencje wyrazów z wielkiej litery ("Shiba Inu").
    for (int i = 0; i < words.size();) {
        int end = i;
        while (end < words.size() && isNameWord(words.at(end)) && isCapitalized(words.at(end).text)) {
            ++end;
        }
        if (end - i >= 2) {
            QStringList phrase;
            for (int j = i; j < end; ++j) {
                phrase.append(words.at(j).text);
                words[j].consumed = true;
            }
            found.append({phrase.join(QLatin1Char(' ')), CandidateSymbol::Origin::InstrumentName,
                          kCapitalizedNameConfidence, words.at(i).position});
            i = end;
        } else {
            i = end > i ? end : i + 1;
        }
    }

    for (Word& word : words) {
        if (!isNameWord(word)) {
            continue;
        }
        word.consumed = true;
        if (isUppercaseTicker(word.text)) {
            found.append({word.text, CandidateSymbol::Origin::BareTicker, kBareTickerConfidence, word.position});
        } else if (word.text.size() >= 2 && word.text.size() <= kMaxWordLength) {
            found.append({word.text, CandidateSymbol::Origin::Word, kWordConfidence, word.position});
        }
    }

    std::stable_sort(found.begin(), found.end(), [](const CandidateSymbol& lhs, const CandidateSymbol& rhs) {
        if (lhs.confidence != rhs.confidence) {
            return lhs.confidence > rhs.confidence;
        }
        return lhs.position < rhs.position;
    });

    QVector<CandidateSymbol> candidates;
    QSet<QString> seen;
    for (const auto& candidate : found) {
        const QString key = candidate.text.toLower();
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        candidates.append(candidate);
        if (candidates.size() >= m_maxCandidates) {
            break;
        }
    }

    qCDebug(lcSymbolExtractor) << "Kandydaci dla" << query.text() << ":" << texts(candidates);
    return candidates;
}

} // namespace marketbrief
