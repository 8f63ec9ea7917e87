#pragma once

#include <QString>

#include <functional>
#include <optional>

#include "models/AssetTypes.hpp"
#include "resolve/ResolverStrategy.hpp"

namespace marketbrief {

/*!
 * Probes the asset class the resolver did not pick for the same symbol.
 *
 * Only symbols the user actually typed are probed: a match found by name
 * search under a different symbol never raises a conflict.
 *
 * A collision is reported only when the probe returns the same symbol under a
 * different name, i.e. an unrelated instrument sharing the letters. The
 * resolved asset and every colliding match are returned together; no class wins.
 */
class ConflictDetector {
public:
    using SymbolLookup = std::function<std::optional<ResolvedAsset>(const QString& symbol)>;

    ConflictDetector(SymbolLookup equityLookup, SymbolLookup cryptoLookup);

    std::optional<ConflictReport> detect(const ResolutionInput& input, const ResolvedAsset& resolved) const;

    static bool collides(const ResolvedAsset& resolved, const ResolvedAsset& probed);

private:
    SymbolLookup m_equityLookup;
    SymbolLookup m_cryptoLookup;
};

} // namespace marketbrief
