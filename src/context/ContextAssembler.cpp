#include "ContextAssembler.hpp"

#include <QLoggingCategory>

#include <exception>
#include <utility>

Q_LOGGING_CATEGORY(lcContextAssembler, "marketbrief.context.assembler")

namespace marketbrief {

ContextAssembler::ContextAssembler()
    : m_clock([] { return QDateTime::currentDateTimeUtc(); })
{
}

void ContextAssembler::setClockForTesting(Clock clock)
{
    if (clock) {
        m_clock = std::move(clock);
    }
}

AggregatedContext ContextAssembler::minimalContext(const QString& queryText, const QueryClassification& classification)
{
    AggregatedContext context;
    context.queryText = queryText;
    context.classification = classification;
    return context;
}

AggregatedContext ContextAssembler::assemble(const AssemblyInput& input) const
{
    try {
        return assembleUnchecked(input);
    } catch (const std::exception& ex) {
        qCWarning(lcContextAssembler) << "Składanie kontekstu nie powiodło się, zwracam kontekst minimalny:"
                                      << ex.what();
    }
    AggregatedContext fallback = minimalContext(input.queryText, input.classification);
    fallback.degraded = true;
    fallback.limitations.append(QStringLiteral("Market data could not be assembled for this question."));
    return fallback;
}

AggregatedContext ContextAssembler::assembleUnchecked(const AssemblyInput& input) const
{
    AggregatedContext context = minimalContext(input.queryText, input.classification);

    if (input.queryText.trimmed().isEmpty()) {
        context.limitations.append(QStringLiteral("The question was empty; only general guidance is available."));
    }

    const QVector<ResolvedAsset>& assets = input.resolution.assets;
    context.assets.reserve(assets.size());
    for (int index = 0; index < assets.size(); ++index) {
        const IndicatorMap indicators = index < input.indicatorsByAsset.size() ? input.indicatorsByAsset.at(index)
                                                                               : IndicatorMap{};
        AssetContext assetContext = buildAssetContext(assets.at(index), indicators);
        if (assetContext.indicators.isEmpty()) {
            context.limitations.append(
                QStringLiteral("No technical indicators are available for %1.").arg(assetContext.asset.symbol));
        } else if (assetContext.indicators.size() < static_cast<int>(kIndicatorConfigs.size())) {
            QStringList missing;
            for (const IndicatorConfig& config : kIndicatorConfigs) {
                if (!assetContext.indicators.contains(config.type)) {
                    missing.append(indicatorTypeName(config.type));
                }
            }
            context.limitations.append(QStringLiteral("%1 is missing %2 data.")
                                           .arg(assetContext.asset.symbol, missing.join(QStringLiteral(", "))));
        }
        context.assets.append(std::move(assetContext));
    }

    context.conflicts = input.resolution.conflicts;
    for (const ConflictReport& conflict : context.conflicts) {
        QStringList names;
        for (const ResolvedAsset& match : conflict.matches) {
            names.append(QStringLiteral("%1 (%2)").arg(match.name, assetClassName(match.assetClass)));
        }
        context.limitations.append(QStringLiteral("%1 is ambiguous and may refer to %2.")
                                       .arg(conflict.candidate, names.join(QStringLiteral(" or "))));
    }

    for (const QString& unresolved : input.resolution.unresolved) {
        context.limitations.append(QStringLiteral("No market data was found for \"%1\".").arg(unresolved));
    }

    if (input.bellwethers && !input.bellwethers->isEmpty()) {
        context.bellwethers = input.bellwethers;
    } else {
        context.limitations.append(QStringLiteral("Market sentiment data is unavailable."));
    }

    if (input.calendar && !input.calendar->week.isEmpty()) {
        EconomicCalendar calendar = *input.calendar;
        const QDate today = m_clock().date();
        for (CalendarDay& day : calendar.week) {
            day.isToday = day.date == today;
        }
        context.calendar = std::move(calendar);
    } else {
        context.limitations.append(QStringLiteral("The economic calendar is unavailable."));
    }

    // Wiadomości są tłem; ich brak nie jest ograniczeniem odpowiedzi.
    if (input.news && !input.news->isEmpty()) {
        context.news = input.news;
    }
    if (input.cryptoNews && !input.cryptoNews->isEmpty()) {
        context.cryptoNews = input.cryptoNews;
    }

    qCDebug(lcContextAssembler) << "Kontekst:" << context.assets.size() << "aktywów," << context.conflicts.size()
                                << "konfliktów," << context.limitations.size() << "ograniczeń";
    return context;
}

AssetContext ContextAssembler::buildAssetContext(const ResolvedAsset& asset, const IndicatorMap& indicators)
{
    AssetContext assetContext;
    assetContext.asset = asset;
    for (auto it = indicators.cbegin(); it != indicators.cend(); ++it) {
        if (!it.value().isEmpty()) {
            assetContext.indicators.insert(it.key(), it.value());
        }
    }
    const auto rsi = assetContext.indicators.constFind(IndicatorType::Rsi);
    if (rsi != assetContext.indicators.constEnd()) {
        assetContext.latestRsi = rsi->latestValue();
        if (assetContext.latestRsi) {
            assetContext.rsiReading = rsiReadingFor(*assetContext.latestRsi);
        }
    }
    return assetContext;
}

} // namespace marketbrief
