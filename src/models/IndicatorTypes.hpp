#pragma once

#include <QDateTime>
#include <QMap>
#include <QString>
#include <QVector>

#include <array>
#include <optional>

namespace marketbrief {

enum class IndicatorType {
    Rsi,
    Ema,
    Sma,
    Dema,
};

QString indicatorTypeName(IndicatorType type);
//! Lowercase key used in serialized contexts ("rsi", "ema", ...).
QString indicatorTypeKey(IndicatorType type);
std::optional<IndicatorType> indicatorTypeFromName(const QString& name);

struct IndicatorConfig {
    IndicatorType type;
    const char*   timeframe;
    int           period;
};

// Stała konfiguracja wskaźników pobieranych dla każdego aktywa.
inline constexpr std::array<IndicatorConfig, 4> kIndicatorConfigs{{
    {IndicatorType::Rsi, "2h", 28},
    {IndicatorType::Ema, "4h", 50},
    {IndicatorType::Dema, "4h", 20},
    {IndicatorType::Sma, "4h", 200},
}};

const IndicatorConfig& indicatorConfigFor(IndicatorType type);

struct IndicatorPoint {
    QDateTime date;
    double    value = 0.0;
    QString   timeframe;
    int       period = 0;
};

//! Points are ordered newest first.
struct IndicatorSeries {
    IndicatorType           type = IndicatorType::Rsi;
    QString                 timeframe;
    int                     period = 0;
    QVector<IndicatorPoint> points;

    bool isEmpty() const { return points.isEmpty(); }
    std::optional<double> latestValue() const;
};

using IndicatorMap = QMap<IndicatorType, IndicatorSeries>;

} // namespace marketbrief
