#pragma once

#include <memory>

#include "config/PipelineConfig.hpp"
#include "grpc/CryptoDataClient.hpp"
#include "grpc/EquityDataClient.hpp"

namespace marketbrief {

std::shared_ptr<EquityDataClient> makeEquityDataClient(const PipelineConfig& config);
std::shared_ptr<CryptoDataClient> makeCryptoDataClient(const PipelineConfig& config);

} // namespace marketbrief
