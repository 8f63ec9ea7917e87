#pragma once

#include <QHash>
#include <QString>

#include <mutex>

#include "providers/AssetStore.hpp"

class QJsonArray;
class QJsonObject;

namespace marketbrief {

//! Asset store backed by a JSON snapshot file exported by the refresh jobs.
class JsonAssetStore final : public AssetStoreInterface {
public:
    JsonAssetStore();
    ~JsonAssetStore() override;

    bool loadFromFile(const QString& path, QString* errorMessage = nullptr);
    bool loadFromJson(const QByteArray& json, QString* errorMessage = nullptr);

    Result<BellwetherProfile> bellwetherProfile(const QString& symbol) const override;
    Result<IndicatorSeries> indicatorSnapshot(const QString& symbol, IndicatorType type) const override;
    Result<EconomicCalendar> economicCalendar() const override;
    Result<QVector<NewsItem>> recentNews(NewsFeed feed) const override;

    int bellwetherCount() const;

private:
    struct BellwetherRecord {
        BellwetherProfile                     profile;
        QHash<QString, IndicatorSeries>       snapshots; // klucz: nazwa wskaźnika (RSI, EMA, ...)
    };

    static BellwetherRecord parseBellwether(const QJsonObject& object);
    static EconomicCalendar parseCalendar(const QJsonObject& object);
    static QVector<NewsItem> parseNews(const QJsonArray& array);

    mutable std::mutex               m_mutex;
    QHash<QString, BellwetherRecord> m_bellwethers;
    std::optional<EconomicCalendar>  m_calendar;
    QVector<NewsItem>                m_marketNews;
    QVector<NewsItem>                m_cryptoNews;
};

} // namespace marketbrief
