#include "IndicatorTypes.hpp"

namespace marketbrief {

QString indicatorTypeName(IndicatorType type)
{
    switch (type) {
    case IndicatorType::Rsi:
        return QStringLiteral("RSI");
    case IndicatorType::Ema:
        return QStringLiteral("EMA");
    case IndicatorType::Sma:
        return QStringLiteral("SMA");
    case IndicatorType::Dema:
        return QStringLiteral("DEMA");
    }
    return {};
}

QString indicatorTypeKey(IndicatorType type)
{
    return indicatorTypeName(type).toLower();
}

std::optional<IndicatorType> indicatorTypeFromName(const QString& name)
{
    const QString upper = name.trimmed().toUpper();
    for (const auto& config : kIndicatorConfigs) {
        if (indicatorTypeName(config.type) == upper) {
            return config.type;
        }
    }
    return std::nullopt;
}

const IndicatorConfig& indicatorConfigFor(IndicatorType type)
{
    for (const auto& config : kIndicatorConfigs) {
        if (config.type == type) {
            return config;
        }
    }
    return kIndicatorConfigs.front();
}

std::optional<double> IndicatorSeries::latestValue() const
{
    if (points.isEmpty()) {
        return std::nullopt;
    }
    return points.constFirst().value;
}

} // namespace marketbrief
