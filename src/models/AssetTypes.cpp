#include "AssetTypes.hpp"

namespace marketbrief {

QString assetClassName(AssetClass assetClass)
{
    switch (assetClass) {
    case AssetClass::Equity:
        return QStringLiteral("EQUITY");
    case AssetClass::Crypto:
        return QStringLiteral("CRYPTO");
    }
    return {};
}

bool ResolvedAsset::isSameInstrument(const ResolvedAsset& other) const
{
    return assetClass == other.assetClass
        && symbol.compare(other.symbol, Qt::CaseInsensitive) == 0;
}

} // namespace marketbrief
