#include "SymbolNormalizer.hpp"

#include <QRegularExpression>
#include <QStringList>

namespace marketbrief {

namespace {

// Najdłuższy sufiks jako pierwszy, inaczej "USD" obcięłoby "USDT" do "...T".
const QStringList& quoteSuffixes()
{
    static const QStringList suffixes{QStringLiteral("USDT"), QStringLiteral("USDC"), QStringLiteral("USD")};
    return suffixes;
}

const QVector<QRegularExpression>& tickerPatterns()
{
    static const QVector<QRegularExpression> patterns{
        QRegularExpression(QStringLiteral("^[A-Z]{1,5}(\\.[A-Z])?$")),
        QRegularExpression(QStringLiteral("^[A-Z]{3,6}(/?[A-Z]{3,6})?$")),
        QRegularExpression(QStringLiteral("^[A-Z]{3}/?[A-Z]{3}$")),
        QRegularExpression(QStringLiteral("^[A-Z]{1,3}[FGHJKMNQUVXZ]\\d{2}$")),
    };
    return patterns;
}

} // namespace

QString stripQuoteSuffix(const QString& symbol)
{
    const QString upper = symbol.trimmed().toUpper();
    for (const QString& suffix : quoteSuffixes()) {
        if (upper.endsWith(suffix) && upper.size() - suffix.size() >= 2) {
            QString base = upper.left(upper.size() - suffix.size());
            if (base.endsWith(QLatin1Char('/')) || base.endsWith(QLatin1Char('-'))) {
                base.chop(1);
            }
            if (base.size() >= 2) {
                return base;
            }
        }
    }
    return upper;
}

bool hasQuoteSuffix(const QString& symbol)
{
    return stripQuoteSuffix(symbol) != symbol.trimmed().toUpper();
}

bool isValidTicker(const QString& symbol)
{
    const QString upper = symbol.trimmed().toUpper();
    if (upper.isEmpty()) {
        return false;
    }
    for (const QRegularExpression& pattern : tickerPatterns()) {
        if (pattern.match(upper).hasMatch()) {
            return true;
        }
    }
    return false;
}

bool isContractAddress(const QString& text)
{
    static const QRegularExpression pattern(QStringLiteral("^0x[0-9a-fA-F]{40}$"));
    return pattern.match(text.trimmed()).hasMatch();
}

QString indicatorSymbolFor(const ResolvedAsset& asset)
{
    const QString symbol = asset.symbol.trimmed().toUpper();
    if (asset.assetClass != AssetClass::Crypto || symbol.isEmpty() || hasQuoteSuffix(symbol)) {
        return symbol;
    }
    return symbol + QStringLiteral("USD");
}

} // namespace marketbrief
