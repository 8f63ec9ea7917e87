#pragma once

#include <QString>

#include <chrono>
#include <memory>
#include <mutex>

#include "grpc/CircuitBreaker.hpp"
#include "grpc/GatewayChannel.hpp"
#include "market_gateway.grpc.pb.h"
#include "providers/MarketDataProvider.hpp"

namespace marketbrief {

//! MarketDataProviderInterface over the gateway's EquityDataService.
class EquityDataClient final : public MarketDataProviderInterface {
public:
    EquityDataClient();
    ~EquityDataClient() override;

    void setEndpoint(const QString& endpoint);
    void setTlsConfig(const GatewayTlsConfig& config);
    void setAuthToken(const QString& token);
    void setCallTimeout(std::chrono::milliseconds timeout);

    QString providerId() const override;
    AssetLookup lookupBySymbol(const QString& symbol) override;
    IndicatorFetch fetchIndicator(const QString& symbol, IndicatorType type, const QString& timeframe,
                                  int period) override;

    GatewayChannel::PreflightResult runPreflightChecklist() const;
    QVector<QPair<QByteArray, QByteArray>> authMetadataForTesting() const;
    bool hasStubForTesting() const;
    CircuitBreaker& circuitBreakerForTesting() { return m_breaker; }

private:
    std::shared_ptr<gateway::v1::EquityDataService::Stub> ensureStub();

    GatewayChannel m_channel;
    CircuitBreaker m_breaker;

    mutable std::mutex                                    m_mutex;
    std::shared_ptr<grpc::Channel>                        m_stubChannel;
    std::shared_ptr<gateway::v1::EquityDataService::Stub> m_stub;
};

} // namespace marketbrief
