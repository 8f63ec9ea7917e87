#pragma once

#include <QStringList>
#include <QVector>

#include <memory>
#include <optional>

#include "models/ContextTypes.hpp"
#include "models/QueryTypes.hpp"
#include "providers/AssetStore.hpp"

namespace marketbrief {

//! Picks reference instruments for the matched categories and reads their RSI/EMA snapshots.
class BellwetherSelector {
public:
    static constexpr int kMaxBellwethers = 5;

    explicit BellwetherSelector(std::shared_ptr<AssetStoreInterface> store, int pointLimit = 12);

    static QStringList symbolsFor(Category category);
    static QStringList defaultSymbols();
    static QStringList symbolsFor(const QueryClassification& classification);

    //! std::nullopt when no selected symbol has a snapshot.
    std::optional<QVector<BellwetherEntry>> select(const QueryClassification& classification) const;

private:
    std::optional<IndicatorSeries> snapshot(const QString& symbol, IndicatorType type) const;

    std::shared_ptr<AssetStoreInterface> m_store;
    int                                  m_pointLimit;
};

} // namespace marketbrief
