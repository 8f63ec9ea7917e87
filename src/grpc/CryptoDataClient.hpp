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

//! CryptoDataProviderInterface over the gateway's CryptoDataService.
class CryptoDataClient final : public CryptoDataProviderInterface {
public:
    CryptoDataClient();
    ~CryptoDataClient() override;

    void setEndpoint(const QString& endpoint);
    void setTlsConfig(const GatewayTlsConfig& config);
    void setAuthToken(const QString& token);
    void setCallTimeout(std::chrono::milliseconds timeout);

    QString providerId() const override;
    AssetLookup lookupBySymbol(const QString& normalizedSymbol) override;
    AssetSearch search(const QString& queryText) override;
    AssetLookup lookupByContract(const QString& platform, const QString& address) override;

    void setSearchLimit(int limit);

    GatewayChannel::PreflightResult runPreflightChecklist() const;
    QVector<QPair<QByteArray, QByteArray>> authMetadataForTesting() const;
    bool hasStubForTesting() const;
    CircuitBreaker& circuitBreakerForTesting() { return m_breaker; }

private:
    std::shared_ptr<gateway::v1::CryptoDataService::Stub> ensureStub();
    AssetLookup unwrapLookup(const grpc::Status& status, const gateway::v1::LookupResponse& response,
                             const char* method, const QString& argument);

    GatewayChannel m_channel;
    CircuitBreaker m_breaker;

    mutable std::mutex                                    m_mutex;
    std::shared_ptr<grpc::Channel>                        m_stubChannel;
    std::shared_ptr<gateway::v1::CryptoDataService::Stub> m_stub;
    int                                                   m_searchLimit = 10;
};

} // namespace marketbrief
