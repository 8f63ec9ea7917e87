#include "QueryClassifier.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcQueryClassifier, "marketbrief.query.classifier")

namespace marketbrief {

namespace {

QVector<QueryClassifier::Rule> buildRules()
{
    return {
        {Category::Crypto,
         {QStringLiteral("crypto"), QStringLiteral("bitcoin"), QStringLiteral("ethereum"),
          QStringLiteral("blockchain"), QStringLiteral("altcoin"), QStringLiteral("stablecoin"),
          QStringLiteral("defi"), QStringLiteral("token")},
         {QStringLiteral("btc"), QStringLiteral("eth"), QStringLiteral("sol"), QStringLiteral("xrp"),
          QStringLiteral("coin"), QStringLiteral("coins"), QStringLiteral("nft"), QStringLiteral("web3"),
          QStringLiteral("wallet")}},
        {Category::Options,
         {QStringLiteral("options"), QStringLiteral("call option"), QStringLiteral("put option"),
          QStringLiteral("strike price"), QStringLiteral("implied volatility"), QStringLiteral("expiration")},
         {QStringLiteral("calls"), QStringLiteral("puts"), QStringLiteral("iv"), QStringLiteral("greeks"),
          QStringLiteral("theta"), QStringLiteral("gamma"), QStringLiteral("straddle"),
          QStringLiteral("strangle"), QStringLiteral("leaps")}},
        {Category::DayTrading,
         {QStringLiteral("day trad"), QStringLiteral("daytrad"), QStringLiteral("intraday"),
          QStringLiteral("scalp")},
         {QStringLiteral("pdt"), QStringLiteral("breakout"), QStringLiteral("momentum"),
          QStringLiteral("1m"), QStringLiteral("5m"), QStringLiteral("15m")}},
        {Category::Memecoin,
         {QStringLiteral("memecoin"), QStringLiteral("meme coin"), QStringLiteral("meme token"),
          QStringLiteral("pump.fun"), QStringLiteral("pumpfun")},
         {QStringLiteral("doge"), QStringLiteral("shib"), QStringLiteral("pepe"), QStringLiteral("bonk"),
          QStringLiteral("wif"), QStringLiteral("meme")}},
        {Category::Forex,
         {QStringLiteral("forex"), QStringLiteral("currency pair"), QStringLiteral("exchange rate"),
          QStringLiteral("fx market")},
         {QStringLiteral("fx"), QStringLiteral("eurusd"), QStringLiteral("usdjpy"), QStringLiteral("gbpusd"),
          QStringLiteral("pip"), QStringLiteral("pips"), QStringLiteral("dxy")}},
        {Category::Commodities,
         {QStringLiteral("commodit"), QStringLiteral("crude oil"), QStringLiteral("natural gas")},
         {QStringLiteral("gold"), QStringLiteral("silver"), QStringLiteral("oil"), QStringLiteral("copper"),
          QStringLiteral("xauusd"), QStringLiteral("xagusd"), QStringLiteral("wheat")}},
        {Category::Economic,
         {QStringLiteral("economic"), QStringLiteral("inflation"), QStringLiteral("interest rate"),
          QStringLiteral("federal reserve"), QStringLiteral("nonfarm"), QStringLiteral("non-farm"),
          QStringLiteral("unemployment"), QStringLiteral("recession")},
         {QStringLiteral("cpi"), QStringLiteral("ppi"), QStringLiteral("gdp"), QStringLiteral("fed"),
          QStringLiteral("fomc"), QStringLiteral("nfp"), QStringLiteral("pce"), QStringLiteral("macro")}},
        {Category::Technical,
         {QStringLiteral("technical analysis"), QStringLiteral("moving average"), QStringLiteral("resistance"),
          QStringLiteral("overbought"), QStringLiteral("oversold"), QStringLiteral("chart pattern")},
         {QStringLiteral("rsi"), QStringLiteral("ema"), QStringLiteral("sma"), QStringLiteral("dema"),
          QStringLiteral("macd"), QStringLiteral("bollinger"), QStringLiteral("fibonacci"),
          QStringLiteral("support")}},
        {Category::MarketTrend,
         {QStringLiteral("market trend"), QStringLiteral("top movers"), QStringLiteral("gainers"),
          QStringLiteral("losers"), QStringLiteral("bullish"), QStringLiteral("bearish")},
         {QStringLiteral("trend"), QStringLiteral("trending"), QStringLiteral("movers"),
          QStringLiteral("performing"), QStringLiteral("best"), QStringLiteral("worst"), QStringLiteral("top")}},
    };
}

} // namespace

const QVector<Category>& categoryPriority()
{
    static const QVector<Category> priority{
        Category::Options,
        Category::DayTrading,
        Category::Memecoin,
        Category::Crypto,
        Category::Forex,
        Category::Commodities,
        Category::Economic,
        Category::Technical,
        Category::MarketTrend,
    };
    return priority;
}

RiskContext riskContextFor(Category category)
{
    switch (category) {
    case Category::Options:
        return {
            {QStringLiteral("position_sizing"), QStringLiteral("Limit premium at risk to 1-2% of capital per position.")},
            {QStringLiteral("time_decay"), QStringLiteral("Theta erodes long premium daily; size expirations to the thesis horizon.")},
            {QStringLiteral("volatility"), QStringLiteral("Compare implied volatility with realized volatility before buying or selling premium.")},
            {QStringLiteral("max_loss"), QStringLiteral("Define maximum loss up front; avoid naked short options.")},
        };
    case Category::DayTrading:
        return {
            {QStringLiteral("position_sizing"), QStringLiteral("Risk no more than 0.5-1% of capital per intraday trade.")},
            {QStringLiteral("stop_loss"), QStringLiteral("Place hard stops below the most recent intraday swing low or high.")},
            {QStringLiteral("daily_limit"), QStringLiteral("Stop trading for the session after hitting the daily loss limit.")},
            {QStringLiteral("liquidity"), QStringLiteral("Trade liquid instruments with tight spreads; avoid the first minutes after the open.")},
        };
    case Category::Memecoin:
        return {
            {QStringLiteral("position_sizing"), QStringLiteral("Treat memecoin exposure as speculative; keep it to a small fraction of the portfolio.")},
            {QStringLiteral("liquidity"), QStringLiteral("Check on-chain liquidity and holder concentration before entering.")},
            {QStringLiteral("volatility"), QStringLiteral("Daily swings above 30% are common; widen stops or reduce size accordingly.")},
            {QStringLiteral("contract_risk"), QStringLiteral("Verify the contract address; copycat tokens reuse popular names and symbols.")},
        };
    case Category::Crypto:
        return {
            {QStringLiteral("position_sizing"), QStringLiteral("Size crypto positions for 24/7 volatility; 1-3% risk per trade.")},
            {QStringLiteral("stop_loss"), QStringLiteral("Use stops beyond key support; weekend liquidity can gap prices.")},
            {QStringLiteral("custody"), QStringLiteral("Consider exchange counterparty risk and self-custody for long-term holdings.")},
            {QStringLiteral("volatility"), QStringLiteral("Expect larger drawdowns than equities; avoid excessive leverage.")},
        };
    case Category::Forex:
        return {
            {QStringLiteral("leverage"), QStringLiteral("Keep effective leverage modest; small moves are amplified.")},
            {QStringLiteral("stop_loss"), QStringLiteral("Set stops in pips relative to the average true range of the pair.")},
            {QStringLiteral("events"), QStringLiteral("Central bank decisions and data releases can gap major pairs.")},
            {QStringLiteral("carry"), QStringLiteral("Account for swap/rollover costs on positions held overnight.")},
        };
    case Category::Commodities:
        return {
            {QStringLiteral("position_sizing"), QStringLiteral("Commodity futures carry high notional exposure; size from contract value, not margin.")},
            {QStringLiteral("seasonality"), QStringLiteral("Supply reports and seasonal demand drive sharp repricing.")},
            {QStringLiteral("rollover"), QStringLiteral("Futures-based products suffer roll costs in contango.")},
        };
    case Category::Economic:
        return {
            {QStringLiteral("event_risk"), QStringLiteral("Reduce size ahead of high-impact releases; spreads widen around the print.")},
            {QStringLiteral("correlation"), QStringLiteral("Macro surprises move asset classes together; diversification weakens.")},
            {QStringLiteral("horizon"), QStringLiteral("Distinguish the initial reaction from the trend that follows the release.")},
        };
    case Category::Technical:
        return {
            {QStringLiteral("confirmation"), QStringLiteral("Confirm indicator signals with price action and volume.")},
            {QStringLiteral("stop_loss"), QStringLiteral("Anchor stops to the levels that invalidate the setup.")},
            {QStringLiteral("timeframe"), QStringLiteral("Indicator readings differ across timeframes; align with the holding period.")},
        };
    case Category::MarketTrend:
        return {
            {QStringLiteral("chasing"), QStringLiteral("Top movers often mean-revert; avoid entering extended moves without a plan.")},
            {QStringLiteral("breadth"), QStringLiteral("Check whether the move is broad-based or driven by a few names.")},
            {QStringLiteral("position_sizing"), QStringLiteral("Scale in rather than committing full size at once.")},
        };
    }
    return defaultRiskContext();
}

RiskContext defaultRiskContext()
{
    return {
        {QStringLiteral("position_sizing"), QStringLiteral("Default to conservative position sizing (1-2% of capital per trade).")},
        {QStringLiteral("stop_loss"), QStringLiteral("Define the exit before the entry and honor it.")},
        {QStringLiteral("diversification"), QStringLiteral("Avoid concentrating the portfolio in a single asset or theme.")},
        {QStringLiteral("disclaimer"), QStringLiteral("Market analysis is educational and not individual investment advice.")},
    };
}

QueryClassifier::QueryClassifier()
    : m_rules(buildRules())
{
}

QueryClassification QueryClassifier::classify(const Query& query) const
{
    QueryClassification classification;
    classification.riskContext = defaultRiskContext();
    if (query.isEmpty()) {
        qCDebug(lcQueryClassifier) << "Puste zapytanie - klasyfikacja domyślna";
        return classification;
    }

    QVector<Category> matched;
    for (const Rule& rule : m_rules) {
        if (matches(rule, query)) {
            matched.append(rule.category);
        }
    }

    // Kolejność wyniku wynika z priorytetu, nie z kolejności reguł.
    for (Category category : categoryPriority()) {
        if (matched.contains(category)) {
            classification.categories.append(category);
        }
    }

    if (!classification.categories.isEmpty()) {
        classification.matchedAny = true;
        classification.riskContext = riskContextFor(classification.categories.constFirst());
    }

    qCDebug(lcQueryClassifier) << "Klasyfikacja" << query.normalized() << "->" << classification.categories.size()
                               << "kategorii";
    return classification;
}

bool QueryClassifier::matches(const Rule& rule, const Query& query) const
{
    for (const QString& term : rule.primaryTerms) {
        if (query.normalized().contains(term)) {
            return true;
        }
    }
    for (const QString& term : rule.secondaryTerms) {
        if (query.tokens().contains(term)) {
            return true;
        }
    }
    return false;
}

} // namespace marketbrief
