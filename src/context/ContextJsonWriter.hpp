#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "models/ContextTypes.hpp"

namespace marketbrief {

//! Typed JSON rendering of an AggregatedContext. Absent sections are absent keys.
class ContextJsonWriter {
public:
    static QJsonObject toJsonObject(const AggregatedContext& context);
    static QByteArray toJson(const AggregatedContext& context, QJsonDocument::JsonFormat format = QJsonDocument::Compact);

    static QJsonObject assetToJson(const ResolvedAsset& asset);
    static QJsonObject seriesToJson(const IndicatorSeries& series);
};

} // namespace marketbrief
