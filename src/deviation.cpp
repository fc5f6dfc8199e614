// Crossfeed - Deviation Detector Implementation

#include <crossfeed/deviation.hpp>
#include <crossfeed/errors.hpp>

namespace crossfeed {

void validate_sample(const PriceSample& sample, const PriceSet& set, const DetectorOptions& options) {
    if (sample.asset != set.asset) {
        throw InvalidSampleError("Sample from " + sample.network + " is for " + sample.asset +
                                 ", expected " + set.asset);
    }

    if (!sample.price.is_positive()) {
        throw InvalidSampleError("Non-positive price " + sample.price.to_string() +
                                 " from " + sample.network);
    }

    if (options.max_staleness_ms > 0) {
        int64_t age_ms = set.collected_at - sample.updated_at * 1000;
        if (age_ms > options.max_staleness_ms) {
            throw InvalidSampleError("Stale price from " + sample.network + ": updated " +
                                     std::to_string(age_ms) + " ms before collection");
        }
    }
}

DeviationReport detect_deviation(const PriceSet& set, const DetectorOptions& options) {
    DeviationReport report;
    report.asset = set.asset;
    report.threshold_percent = options.threshold_percent;
    report.evaluated_at = set.collected_at;
    report.price_set.asset = set.asset;
    report.price_set.collected_at = set.collected_at;
    report.price_set.failures = set.failures;

    for (const auto& [network, sample] : set.samples) {
        try {
            validate_sample(sample, set, options);
            report.price_set.samples.emplace(network, sample);
        } catch (const InvalidSampleError& e) {
            report.warnings.emplace_back(e.what());
            report.price_set.failures[network] = e.what();
        }
    }

    if (report.insufficient_data()) {
        report.deviation_percent = Decimal::zero();
        report.exceeds_threshold = false;
        return report;
    }

    Decimal min_price = report.price_set.samples.begin()->second.price;
    Decimal max_price = min_price;
    for (const auto& [network, sample] : report.price_set.samples) {
        if (sample.price < min_price) min_price = sample.price;
        if (sample.price > max_price) max_price = sample.price;
    }

    // (max - min) * 100 / min in one 256-bit step: a single truncation
    auto deviation = math::mul_div((max_price - min_price).scaled_value(),
                                   Decimal::from_int(100).scaled_value(),
                                   min_price.scaled_value());
    if (!deviation) {
        report.deviation_percent = Decimal::max_value();
        report.exceeds_threshold = true;
        report.warnings.emplace_back("Deviation for " + set.asset + " out of range: " +
                                     max_price.to_string() + " vs " + min_price.to_string());
        return report;
    }

    report.deviation_percent = Decimal(*deviation);
    report.exceeds_threshold = report.deviation_percent > options.threshold_percent;
    return report;
}

DeviationReport detect_deviation(const PriceSet& set, Decimal threshold_percent) {
    return detect_deviation(set, DetectorOptions{threshold_percent, 0});
}

}  // namespace crossfeed
