#pragma once

#include <QString>
#include <QThreadPool>

#include <memory>

#include "config/PipelineConfig.hpp"
#include "context/BellwetherSelector.hpp"
#include "context/ContextAssembler.hpp"
#include "context/NarrativeGenerator.hpp"
#include "indicators/IndicatorAggregator.hpp"
#include "providers/AssetStore.hpp"
#include "providers/MarketDataProvider.hpp"
#include "query/QueryClassifier.hpp"
#include "query/SymbolExtractor.hpp"
#include "resolve/AssetResolver.hpp"

namespace marketbrief {

/*!
 * One query in, one AggregatedContext out.
 *
 * classify || extract -> resolve -> (indicators || bellwethers || calendar || news) -> assemble.
 * Stage fan-out is launched from the calling thread onto the pipeline's own
 * worker pool, so run() must not be called from a task on that pool.
 * Every task started by run() is joined before it returns; the pool only
 * bounds thread count and reuses threads between queries, it carries no state.
 * run() never throws; the worst case is the minimal context.
 */
class ContextPipeline {
public:
    struct Collaborators {
        std::shared_ptr<MarketDataProviderInterface> marketData;
        std::shared_ptr<CryptoDataProviderInterface> cryptoData;
        std::shared_ptr<AssetStoreInterface>         assetStore;
    };

    explicit ContextPipeline(Collaborators collaborators, const PipelineConfig& config = PipelineConfig{});
    ~ContextPipeline();

    ContextPipeline(const ContextPipeline&) = delete;
    ContextPipeline& operator=(const ContextPipeline&) = delete;

    AggregatedContext run(const QString& queryText) const;

    //! Runs the pipeline and hands the context to the generator with the matching template.
    Result<QString> answer(const QString& queryText, NarrativeGeneratorInterface& generator) const;

    static QString templateFor(const AggregatedContext& context);

    const PipelineConfig& config() const { return m_config; }

    void setClockForTesting(ContextAssembler::Clock clock);
    AssetResolver& resolverForTesting() { return m_resolver; }
    IndicatorAggregator& aggregatorForTesting() { return m_aggregator; }

private:
    AggregatedContext runUnchecked(const QString& queryText) const;
    std::optional<EconomicCalendar> loadCalendar() const;
    std::optional<QVector<NewsItem>> loadNews(NewsFeed feed) const;

    PipelineConfig                       m_config;
    std::shared_ptr<AssetStoreInterface> m_assetStore;
    mutable QThreadPool                  m_workerPool;
    QueryClassifier                      m_classifier;
    SymbolExtractor                      m_extractor;
    AssetResolver                        m_resolver;
    IndicatorAggregator                  m_aggregator;
    BellwetherSelector                   m_bellwethers;
    ContextAssembler                     m_assembler;
};

} // namespace marketbrief
