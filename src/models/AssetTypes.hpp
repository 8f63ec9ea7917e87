#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

namespace marketbrief {

enum class AssetClass {
    Equity,
    Crypto,
};

QString assetClassName(AssetClass assetClass);

struct ResolvedAsset {
    QString    symbol;
    QString    name;
    AssetClass assetClass = AssetClass::Equity;
    double     price = 0.0;
    double     changePercent = 0.0;
    double     marketCap = 0.0;
    double     volume = 0.0;
    QString    dataSource;
    QString    providerId;

    bool isSameInstrument(const ResolvedAsset& other) const;
};

//! One raw symbol that matched assets of different classes.
struct ConflictReport {
    QString                candidate;
    QVector<ResolvedAsset> matches;
};

struct ResolutionResult {
    QVector<ResolvedAsset>  assets;
    QVector<ConflictReport> conflicts;
    QStringList             unresolved;

    bool isAmbiguous() const { return !conflicts.isEmpty(); }
    bool isEmpty() const { return assets.isEmpty() && conflicts.isEmpty(); }
};

} // namespace marketbrief

Q_DECLARE_METATYPE(marketbrief::ResolvedAsset)
