#include <QtTest/QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "providers/JsonAssetStore.hpp"

using namespace marketbrief;

namespace {

QByteArray sampleSnapshot()
{
    return QByteArrayLiteral(R"({
        "bellwethers": [
            {
                "symbol": "btc",
                "name": "Bitcoin",
                "descriptors": "largest crypto asset",
                "indicators": {
                    "RSI": [
                        {"date": "2025-03-13 10:00:00", "value": 58.1},
                        {"date": "2025-03-14 10:00:00", "value": 61.4},
                        {"date": "2025-03-12 10:00:00", "value": 55.0}
                    ],
                    "ema": [
                        {"date": "2025-03-14T08:00:00Z", "ema": 83250.5}
                    ],
                    "VWAP": [
                        {"date": "2025-03-14T08:00:00Z", "value": 1.0}
                    ]
                }
            },
            {"name": "missing symbol"}
        ],
        "economic_calendar": {
            "week": [
                {"date": "2025-03-14", "volatility_score": 7.5, "volatility": "high", "number_of_events": 2,
                 "top_events": [{"event": "CPI", "country": "US", "impact": "High", "time": "12:30"}]},
                {"date": "2025-03-12", "volatility_score": 2.0, "volatility": "low", "number_of_events": 0,
                 "top_events": []}
            ],
            "thresholds": {"low": 3.0, "medium": 6.0, "high": 8.0}
        }
    })");
}

} // namespace

class JsonAssetStoreTest : public QObject {
    Q_OBJECT

private slots:
    void loadsBellwethersCaseInsensitively();
    void sortsSnapshotsNewestFirst();
    void acceptsIndicatorNamedValueKey();
    void missingSnapshotIsNotFound();
    void sortsCalendarWeek();
    void readsNewsFeedsInFileOrder();
    void rejectsInvalidJson();
    void reportsMissingFile();
    void loadsFromFile();
};

void JsonAssetStoreTest::loadsBellwethersCaseInsensitively()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));
    QCOMPARE(store.bellwetherCount(), 1);

    const Result<BellwetherProfile> profile = store.bellwetherProfile(QStringLiteral("Btc"));
    QVERIFY(profile.ok());
    QCOMPARE(profile.value().name, QStringLiteral("Bitcoin"));
    QCOMPARE(profile.value().descriptors, QStringLiteral("largest crypto asset"));

    const Result<BellwetherProfile> unknown = store.bellwetherProfile(QStringLiteral("SPY"));
    QVERIFY(!unknown.ok());
    QCOMPARE(unknown.error(), ErrorKind::NotFound);
}

void JsonAssetStoreTest::sortsSnapshotsNewestFirst()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));

    const Result<IndicatorSeries> rsi = store.indicatorSnapshot(QStringLiteral("BTC"), IndicatorType::Rsi);
    QVERIFY(rsi.ok());
    QCOMPARE(rsi.value().points.size(), 3);
    QCOMPARE(rsi.value().points.at(0).value, 61.4);
    QCOMPARE(rsi.value().points.at(2).value, 55.0);
    QCOMPARE(rsi.value().timeframe, QStringLiteral("2h"));
    QCOMPARE(rsi.value().period, 28);
    QCOMPARE(rsi.value().points.at(0).date, QDateTime(QDate(2025, 3, 14), QTime(10, 0), Qt::UTC));
}

void JsonAssetStoreTest::acceptsIndicatorNamedValueKey()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));

    const Result<IndicatorSeries> ema = store.indicatorSnapshot(QStringLiteral("btc"), IndicatorType::Ema);
    QVERIFY(ema.ok());
    QCOMPARE(ema.value().points.size(), 1);
    QCOMPARE(ema.value().points.constFirst().value, 83250.5);
    QCOMPARE(ema.value().period, 50);
}

void JsonAssetStoreTest::missingSnapshotIsNotFound()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));

    QCOMPARE(store.indicatorSnapshot(QStringLiteral("BTC"), IndicatorType::Sma).error(), ErrorKind::NotFound);
    QCOMPARE(store.indicatorSnapshot(QStringLiteral("SPY"), IndicatorType::Rsi).error(), ErrorKind::NotFound);
}

void JsonAssetStoreTest::sortsCalendarWeek()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));

    const Result<EconomicCalendar> calendar = store.economicCalendar();
    QVERIFY(calendar.ok());
    QCOMPARE(calendar.value().week.size(), 2);
    QCOMPARE(calendar.value().week.at(0).date, QDate(2025, 3, 12));
    QCOMPARE(calendar.value().week.at(1).date, QDate(2025, 3, 14));
    QCOMPARE(calendar.value().week.at(1).topEvents.constFirst().title, QStringLiteral("CPI"));
    QCOMPARE(calendar.value().week.at(1).numberOfEvents, 2);
    QCOMPARE(calendar.value().mediumThreshold, 6.0);

    JsonAssetStore empty;
    QVERIFY(empty.loadFromJson(QByteArrayLiteral(R"({"bellwethers": []})")));
    QCOMPARE(empty.economicCalendar().error(), ErrorKind::NotFound);
}

void JsonAssetStoreTest::readsNewsFeedsInFileOrder()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(QByteArrayLiteral(R"({
        "news": [
            {"headline": "Fed holds rates", "date": "2025-03-14 18:00:00", "source": "Reuters",
             "url": "https://example.com/fed"},
            {"headline": "  ", "date": "2025-03-14"},
            {"headline": "Fed holds rates", "date": "2025-03-14 18:00:00", "source": "Reuters"}
        ],
        "crypto_news": [
            {"headline": "ETF inflows accelerate", "date": "2025-03-13", "source": "CoinDesk"}
        ]
    })")));

    const Result<QVector<NewsItem>> news = store.recentNews(NewsFeed::Market);
    QVERIFY(news.ok());
    QCOMPARE(news.value().size(), 2);
    QCOMPARE(news.value().at(0).url, QStringLiteral("https://example.com/fed"));
    QVERIFY(news.value().at(1).url.isEmpty());

    const Result<QVector<NewsItem>> cryptoNews = store.recentNews(NewsFeed::Crypto);
    QVERIFY(cryptoNews.ok());
    QCOMPARE(cryptoNews.value().constFirst().source, QStringLiteral("CoinDesk"));

    JsonAssetStore empty;
    QVERIFY(empty.loadFromJson(sampleSnapshot()));
    QCOMPARE(empty.recentNews(NewsFeed::Market).error(), ErrorKind::NotFound);
    QCOMPARE(empty.recentNews(NewsFeed::Crypto).error(), ErrorKind::NotFound);
}

void JsonAssetStoreTest::rejectsInvalidJson()
{
    JsonAssetStore store;
    QVERIFY(store.loadFromJson(sampleSnapshot()));

    QString error;
    QVERIFY(!store.loadFromJson(QByteArrayLiteral("{\"bellwethers\": ["), &error));
    QVERIFY(!error.isEmpty());
    // Poprzedni snapshot pozostaje aktywny.
    QCOMPARE(store.bellwetherCount(), 1);

    QVERIFY(!store.loadFromJson(QByteArrayLiteral("[1, 2, 3]"), &error));
}

void JsonAssetStoreTest::reportsMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    JsonAssetStore store;
    QString error;
    QVERIFY(!store.loadFromFile(dir.filePath(QStringLiteral("missing.json")), &error));
    QVERIFY(error.contains(QStringLiteral("missing.json")));
}

void JsonAssetStoreTest::loadsFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("snapshots.json"));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(sampleSnapshot());
    file.close();

    JsonAssetStore store;
    QString error;
    QVERIFY2(store.loadFromFile(path, &error), qPrintable(error));
    QCOMPARE(store.bellwetherCount(), 1);
}

QTEST_MAIN(JsonAssetStoreTest)
#include "JsonAssetStoreTest.moc"
