#include "ConflictDetector.hpp"

#include <QLoggingCategory>

#include <utility>

#include "resolve/SymbolNormalizer.hpp"

Q_LOGGING_CATEGORY(lcConflictDetector, "marketbrief.resolve.conflicts")

namespace marketbrief {

ConflictDetector::ConflictDetector(SymbolLookup equityLookup, SymbolLookup cryptoLookup)
    : m_equityLookup(std::move(equityLookup))
    , m_cryptoLookup(std::move(cryptoLookup))
{
}

std::optional<ConflictReport> ConflictDetector::detect(const ResolutionInput& input, const ResolvedAsset& resolved) const
{
    // Trafienia z wyszukiwania po nazwie niosą symbol, którego użytkownik nie wpisał.
    const QString resolvedBase = stripQuoteSuffix(resolved.symbol);
    if (resolvedBase.compare(stripQuoteSuffix(input.normalizedSymbol), Qt::CaseInsensitive) != 0) {
        qCDebug(lcConflictDetector) << "Pomijam sondę dla" << input.rawSymbol << "- dopasowano inny symbol"
                                    << resolved.symbol;
        return std::nullopt;
    }

    std::optional<ResolvedAsset> probed;
    if (resolved.assetClass == AssetClass::Equity) {
        // Sonda krypto podlega temu samemu limitowi kandydatów co ścieżka krypto resolvera.
        if (!input.cryptoEligible || !m_cryptoLookup) {
            return std::nullopt;
        }
        probed = m_cryptoLookup(resolvedBase);
    } else {
        if (!m_equityLookup || !isValidTicker(resolved.symbol)) {
            return std::nullopt;
        }
        probed = m_equityLookup(resolved.symbol);
    }

    if (!probed || !collides(resolved, *probed)) {
        return std::nullopt;
    }

    qCInfo(lcConflictDetector) << "Symbol" << input.rawSymbol << "wskazuje na" << resolved.name << "("
                               << assetClassName(resolved.assetClass) << ") oraz" << probed->name << "("
                               << assetClassName(probed->assetClass) << ")";
    ConflictReport report;
    report.candidate = input.rawSymbol;
    report.matches = {resolved, *probed};
    return report;
}

bool ConflictDetector::collides(const ResolvedAsset& resolved, const ResolvedAsset& probed)
{
    if (resolved.assetClass == probed.assetClass) {
        return false;
    }
    const QString resolvedBase = stripQuoteSuffix(resolved.symbol);
    const QString probedBase = stripQuoteSuffix(probed.symbol);
    if (resolvedBase.compare(probedBase, Qt::CaseInsensitive) != 0) {
        return false;
    }
    return resolved.name.trimmed().compare(probed.name.trimmed(), Qt::CaseInsensitive) != 0;
}

} // namespace marketbrief
