#include "CryptoDataClient.hpp"

#include <QLoggingCategory>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include "grpc/GatewayConversions.hpp"

Q_LOGGING_CATEGORY(lcCryptoClient, "marketbrief.gateway.crypto")

namespace marketbrief {

namespace {

const QString kServiceName = QStringLiteral("CryptoDataService");

} // namespace

CryptoDataClient::CryptoDataClient()
    : m_channel(kServiceName)
    , m_breaker(kServiceName)
{
}

CryptoDataClient::~CryptoDataClient() = default;

void CryptoDataClient::setEndpoint(const QString& endpoint)
{
    m_channel.setEndpoint(endpoint);
}

void CryptoDataClient::setTlsConfig(const GatewayTlsConfig& config)
{
    m_channel.setTlsConfig(config);
}

void CryptoDataClient::setAuthToken(const QString& token)
{
    m_channel.setAuthToken(token);
}

void CryptoDataClient::setCallTimeout(std::chrono::milliseconds timeout)
{
    m_channel.setCallTimeout(timeout);
}

void CryptoDataClient::setSearchLimit(int limit)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_searchLimit = qMax(1, limit);
}

QString CryptoDataClient::providerId() const
{
    return QStringLiteral("gateway-crypto");
}

AssetLookup CryptoDataClient::lookupBySymbol(const QString& normalizedSymbol)
{
    if (!m_breaker.allowRequest()) {
        return AssetLookup::failure(ErrorKind::UpstreamUnavailable, QStringLiteral("Obwód %1 otwarty").arg(kServiceName));
    }
    const auto stub = ensureStub();
    if (!stub) {
        return AssetLookup::failure(ErrorKind::UpstreamUnavailable,
                                    QStringLiteral("Brak połączenia z %1").arg(kServiceName));
    }

    const auto context = m_channel.buildContext();
    gateway::v1::LookupBySymbolRequest request;
    request.set_symbol(normalizedSymbol.trimmed().toUpper().toStdString());
    gateway::v1::LookupResponse response;
    const grpc::Status status = stub->LookupBySymbol(context.get(), request, &response);
    return unwrapLookup(status, response, "LookupBySymbol", normalizedSymbol);
}

AssetSearch CryptoDataClient::search(const QString& queryText)
{
    if (!m_breaker.allowRequest()) {
        return AssetSearch::failure(ErrorKind::UpstreamUnavailable, QStringLiteral("Obwód %1 otwarty").arg(kServiceName));
    }
    const auto stub = ensureStub();
    if (!stub) {
        return AssetSearch::failure(ErrorKind::UpstreamUnavailable,
                                    QStringLiteral("Brak połączenia z %1").arg(kServiceName));
    }

    const auto context = m_channel.buildContext();
    gateway::v1::SearchRequest request;
    request.set_query(queryText.trimmed().toStdString());
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        request.set_limit(m_searchLimit);
    }
    gateway::v1::SearchResponse response;
    const grpc::Status status = stub->Search(context.get(), request, &response);
    if (!status.ok()) {
        qCWarning(lcCryptoClient) << "Search" << queryText << "zakończone błędem"
                                  << QString::fromStdString(status.error_message());
        return failureFromStatus<QVector<ResolvedAsset>>(status, kServiceName, m_breaker);
    }

    m_breaker.recordSuccess();
    QVector<ResolvedAsset> results;
    results.reserve(response.results_size());
    for (const auto& quote : response.results()) {
        ResolvedAsset asset = convertQuote(quote, AssetClass::Crypto, providerId());
        if (asset.symbol.isEmpty()) {
            continue;
        }
        results.append(asset);
    }
    return AssetSearch::success(results);
}

AssetLookup CryptoDataClient::lookupByContract(const QString& platform, const QString& address)
{
    if (!m_breaker.allowRequest()) {
        return AssetLookup::failure(ErrorKind::UpstreamUnavailable, QStringLiteral("Obwód %1 otwarty").arg(kServiceName));
    }
    const auto stub = ensureStub();
    if (!stub) {
        return AssetLookup::failure(ErrorKind::UpstreamUnavailable,
                                    QStringLiteral("Brak połączenia z %1").arg(kServiceName));
    }

    const auto context = m_channel.buildContext();
    gateway::v1::LookupByContractRequest request;
    request.set_platform(platform.trimmed().toLower().toStdString());
    request.set_address(address.trimmed().toLower().toStdString());
    gateway::v1::LookupResponse response;
    const grpc::Status status = stub->LookupByContract(context.get(), request, &response);
    return unwrapLookup(status, response, "LookupByContract", address);
}

AssetLookup CryptoDataClient::unwrapLookup(const grpc::Status& status, const gateway::v1::LookupResponse& response,
                                           const char* method, const QString& argument)
{
    if (!status.ok()) {
        qCWarning(lcCryptoClient) << method << argument << "zakończone błędem"
                                  << QString::fromStdString(status.error_message());
        return failureFromStatus<std::optional<ResolvedAsset>>(status, kServiceName, m_breaker);
    }
    m_breaker.recordSuccess();
    if (!response.found()) {
        return AssetLookup::success(std::nullopt);
    }
    return AssetLookup::success(convertQuote(response.quote(), AssetClass::Crypto, providerId()));
}

GatewayChannel::PreflightResult CryptoDataClient::runPreflightChecklist() const
{
    return m_channel.runPreflightChecklist();
}

QVector<QPair<QByteArray, QByteArray>> CryptoDataClient::authMetadataForTesting() const
{
    return m_channel.authMetadataForTesting();
}

bool CryptoDataClient::hasStubForTesting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_stub);
}

std::shared_ptr<gateway::v1::CryptoDataService::Stub> CryptoDataClient::ensureStub()
{
    const std::shared_ptr<grpc::Channel> channel = m_channel.channel();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!channel) {
        m_stub.reset();
        m_stubChannel.reset();
        return nullptr;
    }
    if (!m_stub || m_stubChannel != channel) {
        m_stub = gateway::v1::CryptoDataService::NewStub(channel);
        m_stubChannel = channel;
    }
    return m_stub;
}

} // namespace marketbrief
