#include "GatewayClientFactory.hpp"

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcGatewayFactory, "marketbrief.gateway.factory")

namespace marketbrief {

namespace {

template <typename Client>
void configureClient(Client& client, const QString& endpoint, const PipelineConfig& config)
{
    client.setEndpoint(endpoint);
    client.setTlsConfig(config.tls);
    client.setAuthToken(config.effectiveAuthToken());
    client.setCallTimeout(std::chrono::milliseconds(config.callTimeoutMs));

    const GatewayChannel::PreflightResult preflight = client.runPreflightChecklist();
    for (const QString& warning : preflight.warnings) {
        qCWarning(lcGatewayFactory) << warning;
    }
    for (const QString& error : preflight.errors) {
        qCWarning(lcGatewayFactory) << error;
    }
}

} // namespace

std::shared_ptr<EquityDataClient> makeEquityDataClient(const PipelineConfig& config)
{
    auto client = std::make_shared<EquityDataClient>();
    configureClient(*client, config.equityEndpoint, config);
    return client;
}

std::shared_ptr<CryptoDataClient> makeCryptoDataClient(const PipelineConfig& config)
{
    auto client = std::make_shared<CryptoDataClient>();
    // Bez osobnego endpointu krypto oba serwisy obsługuje ta sama bramka.
    configureClient(*client, config.cryptoEndpoint.isEmpty() ? config.equityEndpoint : config.cryptoEndpoint, config);
    return client;
}

} // namespace marketbrief
