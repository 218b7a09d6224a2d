#pragma once

#include "procchain/features/feature_types.hpp"

#include <optional>
#include <string_view>

namespace procchain::features {

/// Lazily filled intermediate results shared by the calculators of one series.
struct FeatureCache {
	const Series *series = nullptr;
	mutable std::optional<double> mean;
	mutable std::optional<double> variance;
	mutable std::optional<double> stddev;
	mutable std::optional<double> median;
	mutable std::optional<std::vector<double>> sorted_values;
	mutable std::optional<std::vector<double>> abs_sorted_values;
	mutable std::optional<std::vector<double>> diffs;

	explicit FeatureCache(const Series &series_ref) : series(&series_ref) {
	}
};

double ComputeMean(const Series &series, FeatureCache &cache);
/// Population variance.
double ComputeVariance(const Series &series, FeatureCache &cache);
double ComputeStdDev(const Series &series, FeatureCache &cache);
double ComputeMedian(const Series &series, FeatureCache &cache);
double ComputeSkewness(const Series &series, FeatureCache &cache);
double ComputeKurtosis(const Series &series, FeatureCache &cache);
/// Linear interpolation between order statistics.
double ComputeQuantile(const Series &series, double q, FeatureCache &cache);
double ComputeAutocorrelation(const Series &series, size_t lag, FeatureCache &cache);
const std::vector<double> &ComputeDiffs(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeSorted(const Series &series, FeatureCache &cache);
const std::vector<double> &ComputeAbsSorted(const Series &series, FeatureCache &cache);

struct LinRegResult {
	double slope;
	double intercept;
	double rvalue;
	double std_error;
};

/// Ordinary least squares of y on x; NaN fields when undefined.
LinRegResult ComputeLinearRegression(const std::vector<double> &x, const Series &y);

/// Regression of the series on its sample index; attr is slope, intercept, rvalue or stderr.
double LinearTrend(const Series &series, std::string_view attr);

} // namespace procchain::features
