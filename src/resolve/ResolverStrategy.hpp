#pragma once

#include <QString>
#include <QVector>

#include <functional>
#include <optional>

#include "models/AssetTypes.hpp"
#include "models/QueryTypes.hpp"

namespace marketbrief {

struct ResolutionInput {
    CandidateSymbol candidate;
    QString         rawSymbol;        // uppercased candidate text (bare tickers) or the phrase as typed
    QString         normalizedSymbol; // rawSymbol without a market-quote suffix
    bool            cryptoEligible = false;
};

//! One lookup tier. Returns std::nullopt when the tier has nothing, upstream errors included.
struct ResolverStrategy {
    QString                                                           name;
    std::function<std::optional<ResolvedAsset>(const ResolutionInput&)> resolve;
};

struct StrategyMatch {
    ResolvedAsset asset;
    QString       strategyName;
};

//! Runs tiers in order and stops at the first one that yields an asset.
inline std::optional<StrategyMatch> firstNonEmpty(const QVector<ResolverStrategy>& strategies,
                                                  const ResolutionInput& input)
{
    for (const ResolverStrategy& strategy : strategies) {
        if (!strategy.resolve) {
            continue;
        }
        if (auto asset = strategy.resolve(input)) {
            return StrategyMatch{std::move(*asset), strategy.name};
        }
    }
    return std::nullopt;
}

} // namespace marketbrief
