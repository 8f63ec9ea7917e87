#pragma once

#include <QString>

#include "models/AssetTypes.hpp"

namespace marketbrief {

//! Strips one trailing market-quote suffix (USDT, USDC, USD) when at least two characters remain.
QString stripQuoteSuffix(const QString& symbol);

bool hasQuoteSuffix(const QString& symbol);

//! True when the uppercased text looks like a stock, crypto pair, forex pair or futures ticker.
bool isValidTicker(const QString& symbol);

bool isContractAddress(const QString& text);

//! Symbol used for indicator requests: crypto assets are quoted against USD (ETH -> ETHUSD).
QString indicatorSymbolFor(const ResolvedAsset& asset);

} // namespace marketbrief
