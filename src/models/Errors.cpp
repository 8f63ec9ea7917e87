#include "Errors.hpp"

namespace marketbrief {

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NotFound:
        return QStringLiteral("not_found");
    case ErrorKind::AmbiguousAsset:
        return QStringLiteral("ambiguous_asset");
    case ErrorKind::UpstreamUnavailable:
        return QStringLiteral("upstream_unavailable");
    case ErrorKind::PartialData:
        return QStringLiteral("partial_data");
    case ErrorKind::InvalidQuery:
        return QStringLiteral("invalid_query");
    case ErrorKind::InvalidArgument:
        return QStringLiteral("invalid_argument");
    }
    return QStringLiteral("unknown");
}

} // namespace marketbrief
