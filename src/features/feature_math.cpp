#include "procchain/features/feature_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace procchain::features {

namespace {

constexpr double kEpsilon = 1e-12;

double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

} // namespace

double ComputeMean(const Series &series, FeatureCache &cache) {
	if (cache.mean) {
		return *cache.mean;
	}
	if (series.empty()) {
		cache.mean = NaN();
		return *cache.mean;
	}
	double sum = std::accumulate(series.begin(), series.end(), 0.0);
	cache.mean = sum / static_cast<double>(series.size());
	return *cache.mean;
}

double ComputeVariance(const Series &series, FeatureCache &cache) {
	if (cache.variance) {
		return *cache.variance;
	}
	if (series.empty()) {
		cache.variance = NaN();
		return *cache.variance;
	}
	double mean = ComputeMean(series, cache);
	double accum = 0.0;
	for (double value : series) {
		double diff = value - mean;
		accum += diff * diff;
	}
	cache.variance = accum / static_cast<double>(series.size());
	return *cache.variance;
}

double ComputeStdDev(const Series &series, FeatureCache &cache) {
	if (cache.stddev) {
		return *cache.stddev;
	}
	double variance = ComputeVariance(series, cache);
	cache.stddev = variance < 0 ? NaN() : std::sqrt(variance);
	return *cache.stddev;
}

const std::vector<double> &ComputeSorted(const Series &series, FeatureCache &cache) {
	if (!cache.sorted_values) {
		cache.sorted_values = series;
		std::sort(cache.sorted_values->begin(), cache.sorted_values->end());
	}
	return *cache.sorted_values;
}

const std::vector<double> &ComputeAbsSorted(const Series &series, FeatureCache &cache) {
	if (!cache.abs_sorted_values) {
		std::vector<double> values(series.size());
		std::transform(series.begin(), series.end(), values.begin(), [](double v) { return std::fabs(v); });
		std::sort(values.begin(), values.end());
		cache.abs_sorted_values = std::move(values);
	}
	return *cache.abs_sorted_values;
}

double ComputeMedian(const Series &series, FeatureCache &cache) {
	if (cache.median) {
		return *cache.median;
	}
	if (series.empty()) {
		cache.median = NaN();
		return *cache.median;
	}
	const auto &sorted = ComputeSorted(series, cache);
	size_t n = sorted.size();
	if (n % 2 == 1) {
		cache.median = sorted[n / 2];
	} else {
		cache.median = (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
	}
	return *cache.median;
}

// Adjusted Fisher-Pearson sample skewness.
double ComputeSkewness(const Series &series, FeatureCache &cache) {
	if (series.size() < 3) {
		return NaN();
	}
	double mean = ComputeMean(series, cache);
	double sum_sq = 0.0;
	double sum_cub = 0.0;
	for (double value : series) {
		double diff = value - mean;
		sum_sq += diff * diff;
		sum_cub += diff * diff * diff;
	}
	double n = static_cast<double>(series.size());
	double sample_std = std::sqrt(sum_sq / (n - 1.0));
	if (sample_std < kEpsilon) {
		return 0.0;
	}
	return (n / ((n - 1.0) * (n - 2.0))) * sum_cub / (sample_std * sample_std * sample_std);
}

// Bias-corrected sample excess kurtosis.
double ComputeKurtosis(const Series &series, FeatureCache &cache) {
	if (series.size() < 4) {
		return NaN();
	}
	double mean = ComputeMean(series, cache);
	double variance = ComputeVariance(series, cache);
	if (variance < kEpsilon) {
		return 0.0;
	}
	double fourth = 0.0;
	for (double value : series) {
		double diff = value - mean;
		fourth += diff * diff * diff * diff;
	}
	double n = static_cast<double>(series.size());
	double sample_variance = variance * n / (n - 1.0);
	return (n * (n + 1.0) * fourth) / (sample_variance * sample_variance * (n - 1.0) * (n - 2.0) * (n - 3.0)) -
	       (3.0 * (n - 1.0) * (n - 1.0)) / ((n - 2.0) * (n - 3.0));
}

double ComputeQuantile(const Series &series, double q, FeatureCache &cache) {
	if (series.empty()) {
		return NaN();
	}
	const auto &sorted = ComputeSorted(series, cache);
	double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
	auto idx = static_cast<size_t>(pos);
	double frac = pos - static_cast<double>(idx);
	if (idx + 1 < sorted.size()) {
		return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
	}
	return sorted.back();
}

const std::vector<double> &ComputeDiffs(const Series &series, FeatureCache &cache) {
	if (!cache.diffs) {
		std::vector<double> diffs;
		if (series.size() >= 2) {
			diffs.reserve(series.size() - 1);
			for (size_t i = 1; i < series.size(); ++i) {
				diffs.push_back(series[i] - series[i - 1]);
			}
		}
		cache.diffs = std::move(diffs);
	}
	return *cache.diffs;
}

double ComputeAutocorrelation(const Series &series, size_t lag, FeatureCache &cache) {
	if (lag >= series.size() || series.size() < 2) {
		return NaN();
	}
	double mean = ComputeMean(series, cache);
	double variance = ComputeVariance(series, cache);
	if (variance < kEpsilon) {
		return NaN();
	}
	double numerator = 0.0;
	for (size_t i = 0; i < series.size() - lag; ++i) {
		numerator += (series[i] - mean) * (series[i + lag] - mean);
	}
	return numerator / (static_cast<double>(series.size() - lag) * variance);
}

LinRegResult ComputeLinearRegression(const std::vector<double> &x, const Series &y) {
	LinRegResult result {NaN(), NaN(), NaN(), NaN()};
	if (x.size() != y.size() || x.size() < 2) {
		return result;
	}
	const auto n = static_cast<double>(x.size());
	double sum_x = std::accumulate(x.begin(), x.end(), 0.0);
	double sum_y = std::accumulate(y.begin(), y.end(), 0.0);
	double sum_xx = 0.0;
	double sum_xy = 0.0;
	for (size_t i = 0; i < x.size(); ++i) {
		sum_xx += x[i] * x[i];
		sum_xy += x[i] * y[i];
	}
	double denominator = n * sum_xx - sum_x * sum_x;
	if (std::fabs(denominator) < kEpsilon) {
		return result;
	}
	result.slope = (n * sum_xy - sum_x * sum_y) / denominator;
	result.intercept = (sum_y - result.slope * sum_x) / n;

	double mean_y = sum_y / n;
	double ss_tot = 0.0;
	double ss_res = 0.0;
	for (size_t i = 0; i < x.size(); ++i) {
		double yhat = result.intercept + result.slope * x[i];
		ss_tot += (y[i] - mean_y) * (y[i] - mean_y);
		ss_res += (y[i] - yhat) * (y[i] - yhat);
	}
	if (ss_tot > kEpsilon) {
		result.rvalue = std::sqrt(std::max(0.0, 1.0 - ss_res / ss_tot));
		if (result.slope < 0.0) {
			result.rvalue = -result.rvalue;
		}
	}
	if (x.size() > 2) {
		result.std_error = std::sqrt(ss_res / (n - 2.0)) / std::sqrt(sum_xx - sum_x * sum_x / n);
	}
	return result;
}

double LinearTrend(const Series &series, std::string_view attr) {
	std::vector<double> x(series.size());
	std::iota(x.begin(), x.end(), 0.0);
	auto lin = ComputeLinearRegression(x, series);
	if (attr == "slope") {
		return lin.slope;
	}
	if (attr == "intercept") {
		return lin.intercept;
	}
	if (attr == "rvalue") {
		return lin.rvalue;
	}
	if (attr == "stderr") {
		return lin.std_error;
	}
	return NaN();
}

} // namespace procchain::features
