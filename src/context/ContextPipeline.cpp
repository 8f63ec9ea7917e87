#include "ContextPipeline.hpp"

#include <QFuture>
#include <QLoggingCategory>
#include <QThread>
#include <QtConcurrent>

#include <chrono>
#include <exception>
#include <utility>

Q_LOGGING_CATEGORY(lcContextPipeline, "marketbrief.pipeline")

namespace marketbrief {

namespace {

AssetResolver::Options resolverOptions(const PipelineConfig& config)
{
    AssetResolver::Options options;
    options.maxCryptoCandidates = config.maxCryptoCandidates;
    options.lookupTtl = std::chrono::seconds(config.lookupTtlSeconds);
    return options;
}

IndicatorAggregator::Options aggregatorOptions(const PipelineConfig& config)
{
    IndicatorAggregator::Options options;
    options.ttl = std::chrono::seconds(config.indicatorTtlSeconds);
    options.pointLimit = config.indicatorPointLimit;
    return options;
}

} // namespace

ContextPipeline::ContextPipeline(Collaborators collaborators, const PipelineConfig& config)
    : m_config(config)
    , m_assetStore(collaborators.assetStore)
    , m_extractor(config.maxCandidates)
    , m_resolver(collaborators.marketData, collaborators.cryptoData, resolverOptions(config))
    , m_aggregator(collaborators.marketData, aggregatorOptions(config))
    , m_bellwethers(collaborators.assetStore, config.indicatorPointLimit)
{
    m_workerPool.setMaxThreadCount(config.workerThreads > 0 ? config.workerThreads : QThread::idealThreadCount());
    m_resolver.setThreadPool(&m_workerPool);
    m_aggregator.setThreadPool(&m_workerPool);
}

ContextPipeline::~ContextPipeline()
{
    m_workerPool.waitForDone();
}

void ContextPipeline::setClockForTesting(ContextAssembler::Clock clock)
{
    m_assembler.setClockForTesting(std::move(clock));
}

QString ContextPipeline::templateFor(const AggregatedContext& context)
{
    return context.requiresDisambiguation() ? QStringLiteral("disambiguation") : QStringLiteral("analysis");
}

AggregatedContext ContextPipeline::run(const QString& queryText) const
{
    try {
        return runUnchecked(queryText);
    } catch (const std::exception& ex) {
        qCWarning(lcContextPipeline) << "Potok kontekstu przerwany, zwracam kontekst minimalny:" << ex.what();
    }
    AggregatedContext fallback = ContextAssembler::minimalContext(queryText, m_classifier.classify(Query::fromText(queryText)));
    fallback.degraded = true;
    fallback.limitations.append(QStringLiteral("Market data could not be assembled for this question."));
    return fallback;
}

Result<QString> ContextPipeline::answer(const QString& queryText, NarrativeGeneratorInterface& generator) const
{
    const AggregatedContext context = run(queryText);
    const QString templateName = templateFor(context);
    qCDebug(lcContextPipeline) << "Przekazuję kontekst do generatora, szablon" << templateName;
    return generator.generate(context, queryText, templateName);
}

AggregatedContext ContextPipeline::runUnchecked(const QString& queryText) const
{
    const Query query = Query::fromText(queryText);
    if (query.isEmpty()) {
        qCInfo(lcContextPipeline) << "Puste zapytanie - zwracam klasyfikację domyślną";
    }

    QFuture<QueryClassification> classification = QtConcurrent::run(&m_workerPool, [this, query]() {
        return m_classifier.classify(query);
    });
    QFuture<QVector<CandidateSymbol>> extraction = QtConcurrent::run(&m_workerPool, [this, query]() {
        return m_extractor.extract(query);
    });
    classification.waitForFinished();
    extraction.waitForFinished();

    AssemblyInput input;
    input.queryText = queryText;
    input.classification = classification.result();
    const QVector<CandidateSymbol> candidates = extraction.result();

    if (!candidates.isEmpty()) {
        input.resolution = m_resolver.resolve(candidates);
    }

    QFuture<std::optional<QVector<BellwetherEntry>>> bellwethers =
        QtConcurrent::run(&m_workerPool, [this, classification = input.classification]() {
            return m_bellwethers.select(classification);
        });
    QFuture<std::optional<EconomicCalendar>> calendar = QtConcurrent::run(&m_workerPool, [this]() {
        return loadCalendar();
    });
    QFuture<std::optional<QVector<NewsItem>>> news = QtConcurrent::run(&m_workerPool, [this]() {
        return loadNews(NewsFeed::Market);
    });
    QFuture<std::optional<QVector<NewsItem>>> cryptoNews = QtConcurrent::run(&m_workerPool, [this]() {
        return loadNews(NewsFeed::Crypto);
    });

    if (!input.resolution.assets.isEmpty()) {
        input.indicatorsByAsset = m_aggregator.fetchIndicatorsForAssets(input.resolution.assets);
    }

    bellwethers.waitForFinished();
    calendar.waitForFinished();
    news.waitForFinished();
    cryptoNews.waitForFinished();
    input.bellwethers = bellwethers.result();
    input.calendar = calendar.result();
    input.news = news.result();
    input.cryptoNews = cryptoNews.result();

    qCInfo(lcContextPipeline) << "Zapytanie" << queryText << "- kandydaci" << SymbolExtractor::texts(candidates)
                              << "aktywa" << input.resolution.assets.size() << "konflikty"
                              << input.resolution.conflicts.size();
    return m_assembler.assemble(input);
}

std::optional<EconomicCalendar> ContextPipeline::loadCalendar() const
{
    if (!m_assetStore) {
        return std::nullopt;
    }
    Result<EconomicCalendar> calendar = m_assetStore->economicCalendar();
    if (!calendar.ok()) {
        qCDebug(lcContextPipeline) << "Kalendarz ekonomiczny niedostępny:" << calendar.errorMessage();
        return std::nullopt;
    }
    return calendar.value();
}

std::optional<QVector<NewsItem>> ContextPipeline::loadNews(NewsFeed feed) const
{
    if (!m_assetStore || m_config.newsLimit <= 0) {
        return std::nullopt;
    }
    Result<QVector<NewsItem>> news = m_assetStore->recentNews(feed);
    if (!news.ok()) {
        qCDebug(lcContextPipeline) << "Wiadomości" << newsFeedName(feed) << "niedostępne:" << news.errorMessage();
        return std::nullopt;
    }
    QVector<NewsItem> unique = uniqueHeadlines(news.value(), m_config.newsLimit);
    if (unique.isEmpty()) {
        return std::nullopt;
    }
    return unique;
}

} // namespace marketbrief
