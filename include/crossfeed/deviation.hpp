// Crossfeed - Deviation Detector
// Relative spread between the highest and lowest sample of one round

#pragma once

#include <crossfeed/types.hpp>

namespace crossfeed {

struct DetectorOptions {
    Decimal threshold_percent;
    int64_t max_staleness_ms{0};  // 0 disables the staleness check
};

/// Throws InvalidSampleError when the sample cannot take part in a
/// comparison: wrong asset, non-positive price, or (when enabled) an
/// on-chain update older than max_staleness_ms at collection time.
void validate_sample(const PriceSample& sample, const PriceSet& set, const DetectorOptions& options);

/// deviation = (max - min) / min * 100 over the valid samples.
///
/// Invalid samples are dropped and named in DeviationReport::warnings.
/// With fewer than two valid samples the report carries a zero deviation
/// and never exceeds the threshold. Pure: same input, same report.
DeviationReport detect_deviation(const PriceSet& set, const DetectorOptions& options);

DeviationReport detect_deviation(const PriceSet& set, Decimal threshold_percent);

}  // namespace crossfeed
