#include "EquityDataClient.hpp"

#include <QLoggingCategory>

#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>

#include "grpc/GatewayConversions.hpp"

Q_LOGGING_CATEGORY(lcEquityClient, "marketbrief.gateway.equity")

namespace marketbrief {

namespace {

const QString kServiceName = QStringLiteral("EquityDataService");

} // namespace

EquityDataClient::EquityDataClient()
    : m_channel(kServiceName)
    , m_breaker(kServiceName)
{
}

EquityDataClient::~EquityDataClient() = default;

void EquityDataClient::setEndpoint(const QString& endpoint)
{
    m_channel.setEndpoint(endpoint);
}

void EquityDataClient::setTlsConfig(const GatewayTlsConfig& config)
{
    m_channel.setTlsConfig(config);
}

void EquityDataClient::setAuthToken(const QString& token)
{
    m_channel.setAuthToken(token);
}

void EquityDataClient::setCallTimeout(std::chrono::milliseconds timeout)
{
    m_channel.setCallTimeout(timeout);
}

QString EquityDataClient::providerId() const
{
    return QStringLiteral("gateway-equity");
}

AssetLookup EquityDataClient::lookupBySymbol(const QString& symbol)
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
    request.set_symbol(symbol.trimmed().toUpper().toStdString());
    gateway::v1::LookupResponse response;
    const grpc::Status status = stub->LookupBySymbol(context.get(), request, &response);
    if (!status.ok()) {
        qCWarning(lcEquityClient) << "LookupBySymbol" << symbol << "zakończone błędem"
                                  << QString::fromStdString(status.error_message());
        return failureFromStatus<std::optional<ResolvedAsset>>(status, kServiceName, m_breaker);
    }

    m_breaker.recordSuccess();
    if (!response.found()) {
        return AssetLookup::success(std::nullopt);
    }
    return AssetLookup::success(convertQuote(response.quote(), AssetClass::Equity, providerId()));
}

IndicatorFetch EquityDataClient::fetchIndicator(const QString& symbol, IndicatorType type, const QString& timeframe,
                                                int period)
{
    if (!m_breaker.allowRequest()) {
        return IndicatorFetch::failure(ErrorKind::UpstreamUnavailable,
                                       QStringLiteral("Obwód %1 otwarty").arg(kServiceName));
    }
    const auto stub = ensureStub();
    if (!stub) {
        return IndicatorFetch::failure(ErrorKind::UpstreamUnavailable,
                                       QStringLiteral("Brak połączenia z %1").arg(kServiceName));
    }

    const auto context = m_channel.buildContext();
    gateway::v1::FetchIndicatorRequest request;
    request.set_symbol(symbol.toStdString());
    request.set_indicator_type(indicatorTypeName(type).toStdString());
    request.set_timeframe(timeframe.toStdString());
    request.set_period(period);
    gateway::v1::FetchIndicatorResponse response;
    const grpc::Status status = stub->FetchIndicator(context.get(), request, &response);
    if (!status.ok()) {
        qCWarning(lcEquityClient) << "FetchIndicator" << indicatorTypeName(type) << symbol << "zakończone błędem"
                                  << QString::fromStdString(status.error_message());
        return failureFromStatus<QVector<IndicatorPoint>>(status, kServiceName, m_breaker);
    }

    m_breaker.recordSuccess();
    QVector<IndicatorPoint> points;
    points.reserve(response.values_size());
    for (const auto& value : response.values()) {
        if (!value.has_date()) {
            continue;
        }
        points.append({convertTimestamp(value.date()), value.value(), timeframe, period});
    }
    return IndicatorFetch::success(points);
}

GatewayChannel::PreflightResult EquityDataClient::runPreflightChecklist() const
{
    return m_channel.runPreflightChecklist();
}

QVector<QPair<QByteArray, QByteArray>> EquityDataClient::authMetadataForTesting() const
{
    return m_channel.authMetadataForTesting();
}

bool EquityDataClient::hasStubForTesting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_stub);
}

std::shared_ptr<gateway::v1::EquityDataService::Stub> EquityDataClient::ensureStub()
{
    const std::shared_ptr<grpc::Channel> channel = m_channel.channel();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!channel) {
        m_stub.reset();
        m_stubChannel.reset();
        return nullptr;
    }
    if (!m_stub || m_stubChannel != channel) {
        m_stub = gateway::v1::EquityDataService::NewStub(channel);
        m_stubChannel = channel;
    }
    return m_stub;
}

} // namespace marketbrief
