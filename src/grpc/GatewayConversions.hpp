#pragma once

#include <QDateTime>
#include <QString>

#include <grpcpp/support/status.h>

#include "grpc/CircuitBreaker.hpp"
#include "market_gateway.pb.h"
#include "models/AssetTypes.hpp"
#include "models/Errors.hpp"
#include "models/Result.hpp"

namespace marketbrief {

ErrorKind errorKindForStatus(const grpc::Status& status);

ResolvedAsset convertQuote(const gateway::v1::AssetQuote& quote, AssetClass fallbackClass, const QString& providerId);
QDateTime convertTimestamp(const google::protobuf::Timestamp& timestamp);

//! Maps a non-OK status to a failure and feeds the breaker. NOT_FOUND and INVALID_ARGUMENT are not outages.
template <typename T>
Result<T> failureFromStatus(const grpc::Status& status, const QString& serviceName, CircuitBreaker& breaker)
{
    const ErrorKind kind = errorKindForStatus(status);
    if (kind == ErrorKind::UpstreamUnavailable) {
        breaker.recordFailure();
    } else {
        breaker.recordSuccess();
    }
    return Result<T>::failure(kind, QStringLiteral("%1: %2").arg(serviceName,
                                                                QString::fromStdString(status.error_message())));
}

} // namespace marketbrief
