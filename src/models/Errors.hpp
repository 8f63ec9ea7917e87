#pragma once

#include <QString>

namespace marketbrief {

enum class ErrorKind {
    NotFound,
    AmbiguousAsset,
    UpstreamUnavailable,
    PartialData,
    InvalidQuery,
    InvalidArgument,
};

QString errorKindName(ErrorKind kind);

} // namespace marketbrief
