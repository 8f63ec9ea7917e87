#include "GatewayConversions.hpp"

namespace marketbrief {

ErrorKind errorKindForStatus(const grpc::Status& status)
{
    switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
        return ErrorKind::NotFound;
    case grpc::StatusCode::INVALID_ARGUMENT:
        return ErrorKind::InvalidArgument;
    default:
        break;
    }
    return ErrorKind::UpstreamUnavailable;
}

ResolvedAsset convertQuote(const gateway::v1::AssetQuote& quote, AssetClass fallbackClass, const QString& providerId)
{
    ResolvedAsset asset;
    asset.symbol = QString::fromStdString(quote.symbol()).trimmed().toUpper();
    asset.name = QString::fromStdString(quote.name()).trimmed();
    switch (quote.asset_class()) {
    case gateway::v1::ASSET_CLASS_EQUITY:
        asset.assetClass = AssetClass::Equity;
        break;
    case gateway::v1::ASSET_CLASS_CRYPTO:
        asset.assetClass = AssetClass::Crypto;
        break;
    default:
        asset.assetClass = fallbackClass;
        break;
    }
    asset.price = quote.price();
    asset.changePercent = quote.change_percent();
    asset.marketCap = quote.market_cap();
    asset.volume = quote.volume();
    asset.dataSource = QString::fromStdString(quote.data_source());
    if (asset.dataSource.isEmpty()) {
        asset.dataSource = providerId;
    }
    asset.providerId = providerId;
    return asset;
}

QDateTime convertTimestamp(const google::protobuf::Timestamp& timestamp)
{
    const qint64 seconds = static_cast<qint64>(timestamp.seconds());
    const qint64 nanos = static_cast<qint64>(timestamp.nanos());
    qint64 msecs = seconds * 1000;
    msecs += nanos / 1000000;
    return QDateTime::fromMSecsSinceEpoch(msecs, Qt::UTC);
}

} // namespace marketbrief
