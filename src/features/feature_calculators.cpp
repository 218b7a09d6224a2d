#include "procchain/features/feature_calculators.hpp"
#include "procchain/features/feature_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <unordered_map>

namespace procchain::features {

namespace {

double NaN() {
	return std::numeric_limits<double>::quiet_NaN();
}

double FeatureSumValues(const Series &series, const ParameterMap &, FeatureCache &) {
	return std::accumulate(series.begin(), series.end(), 0.0);
}

double FeatureMean(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeMean(series, cache);
}

double FeatureMedian(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeMedian(series, cache);
}

double FeatureLength(const Series &series, const ParameterMap &, FeatureCache &) {
	return static_cast<double>(series.size());
}

double FeatureStandardDeviation(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeStdDev(series, cache);
}

double FeatureVariance(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeVariance(series, cache);
}

double FeatureRootMeanSquare(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	double sum = 0.0;
	for (double value : series) {
		sum += value * value;
	}
	return std::sqrt(sum / static_cast<double>(series.size()));
}

double FeatureMaximum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	return *std::max_element(series.begin(), series.end());
}

double FeatureMinimum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	return *std::min_element(series.begin(), series.end());
}

double FeatureAbsoluteMaximum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	double max_abs = 0.0;
	for (double value : series) {
		max_abs = std::max(max_abs, std::fabs(value));
	}
	return max_abs;
}

double FeatureSkewness(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeSkewness(series, cache);
}

double FeatureKurtosis(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return ComputeKurtosis(series, cache);
}

double FeatureAbsEnergy(const Series &series, const ParameterMap &, FeatureCache &) {
	double sum = 0.0;
	for (double value : series) {
		sum += value * value;
	}
	return sum;
}

double FeatureMeanAbsChange(const Series &series, const ParameterMap &, FeatureCache &cache) {
	const auto &diffs = ComputeDiffs(series, cache);
	if (diffs.empty()) {
		return NaN();
	}
	double sum = 0.0;
	for (double value : diffs) {
		sum += std::fabs(value);
	}
	return sum / static_cast<double>(diffs.size());
}

double FeatureMeanChange(const Series &series, const ParameterMap &, FeatureCache &cache) {
	const auto &diffs = ComputeDiffs(series, cache);
	if (diffs.empty()) {
		return NaN();
	}
	return std::accumulate(diffs.begin(), diffs.end(), 0.0) / static_cast<double>(diffs.size());
}

// mean of (x[i+1] - 2 x[i] + x[i-1]) / 2
double FeatureMeanSecondDerivativeCentral(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.size() < 3) {
		return NaN();
	}
	double sum = 0.0;
	for (size_t i = 1; i + 1 < series.size(); ++i) {
		sum += 0.5 * (series[i + 1] - 2.0 * series[i] + series[i - 1]);
	}
	return sum / static_cast<double>(series.size() - 2);
}

double FeatureAbsoluteSumOfChanges(const Series &series, const ParameterMap &, FeatureCache &cache) {
	double sum = 0.0;
	for (double value : ComputeDiffs(series, cache)) {
		sum += std::fabs(value);
	}
	return sum;
}

double FeatureCidCe(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	if (series.size() < 2) {
		return NaN();
	}
	Series values = series;
	if (param.GetBool("normalize").value_or(false)) {
		double mean = ComputeMean(series, cache);
		double stddev = ComputeStdDev(series, cache);
		if (stddev < 1e-12) {
			return 0.0;
		}
		for (double &value : values) {
			value = (value - mean) / stddev;
		}
	}
	double sum = 0.0;
	for (size_t i = 1; i < values.size(); ++i) {
		double diff = values[i] - values[i - 1];
		sum += diff * diff;
	}
	return std::sqrt(sum);
}

double FeatureVariationCoefficient(const Series &series, const ParameterMap &, FeatureCache &cache) {
	double mean = ComputeMean(series, cache);
	if (std::fabs(mean) < 1e-12) {
		return NaN();
	}
	return ComputeStdDev(series, cache) / mean;
}

template <typename Compare>
double CountAgainstMean(const Series &series, FeatureCache &cache, Compare compare) {
	double mean = ComputeMean(series, cache);
	return static_cast<double>(
	    std::count_if(series.begin(), series.end(), [&](double value) { return compare(value, mean); }));
}

template <typename Compare>
double LongestStrike(const Series &series, FeatureCache &cache, Compare compare) {
	double mean = ComputeMean(series, cache);
	size_t current = 0;
	size_t best = 0;
	for (double value : series) {
		if (compare(value, mean)) {
			best = std::max(best, ++current);
		} else {
			current = 0;
		}
	}
	return static_cast<double>(best);
}

double FeatureCountAboveMean(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return CountAgainstMean(series, cache, std::greater<double> {});
}

double FeatureCountBelowMean(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return CountAgainstMean(series, cache, std::less<double> {});
}

double FeatureLongestStrikeAboveMean(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return LongestStrike(series, cache, std::greater<double> {});
}

double FeatureLongestStrikeBelowMean(const Series &series, const ParameterMap &, FeatureCache &cache) {
	return LongestStrike(series, cache, std::less<double> {});
}

// Locations are relative: first_* is index / n, last_* is (index + 1) / n.
double FeatureFirstLocationOfMaximum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	auto it = std::max_element(series.begin(), series.end());
	return static_cast<double>(std::distance(series.begin(), it)) / static_cast<double>(series.size());
}

double FeatureLastLocationOfMaximum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	auto it = std::max_element(series.rbegin(), series.rend());
	return static_cast<double>(std::distance(it, series.rend())) / static_cast<double>(series.size());
}

double FeatureFirstLocationOfMinimum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	auto it = std::min_element(series.begin(), series.end());
	return static_cast<double>(std::distance(series.begin(), it)) / static_cast<double>(series.size());
}

double FeatureLastLocationOfMinimum(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	auto it = std::min_element(series.rbegin(), series.rend());
	return static_cast<double>(std::distance(it, series.rend())) / static_cast<double>(series.size());
}

double FeatureRatioBeyondRSigma(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	if (series.empty()) {
		return NaN();
	}
	double r = param.GetDouble("r").value_or(1.0);
	double mean = ComputeMean(series, cache);
	double threshold = r * ComputeStdDev(series, cache);
	auto count = std::count_if(series.begin(), series.end(),
	                           [&](double value) { return std::fabs(value - mean) > threshold; });
	return static_cast<double>(count) / static_cast<double>(series.size());
}

double FeatureQuantile(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	return ComputeQuantile(series, param.GetDouble("q").value_or(0.5), cache);
}

double FeatureAutocorrelation(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	auto lag = static_cast<size_t>(param.GetInt("lag").value_or(1));
	return ComputeAutocorrelation(series, lag, cache);
}

double FeatureLinearTrend(const Series &series, const ParameterMap &param, FeatureCache &) {
	return LinearTrend(series, param.GetString("attr").value_or("slope"));
}

double FeatureNumberCrossingM(const Series &series, const ParameterMap &param, FeatureCache &) {
	double m = param.GetDouble("m").value_or(0.0);
	size_t count = 0;
	for (size_t i = 1; i < series.size(); ++i) {
		bool prev_above = series[i - 1] > m;
		bool curr_above = series[i] > m;
		if (prev_above != curr_above) {
			++count;
		}
	}
	return static_cast<double>(count);
}

double FeatureHasDuplicate(const Series &series, const ParameterMap &, FeatureCache &) {
	std::unordered_map<double, size_t> counts;
	for (double value : series) {
		if (++counts[value] > 1) {
			return 1.0;
		}
	}
	return 0.0;
}

double FeatureHasDuplicateMax(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return 0.0;
	}
	auto max_val = *std::max_element(series.begin(), series.end());
	return std::count(series.begin(), series.end(), max_val) > 1 ? 1.0 : 0.0;
}

double FeatureHasDuplicateMin(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return 0.0;
	}
	auto min_val = *std::min_element(series.begin(), series.end());
	return std::count(series.begin(), series.end(), min_val) > 1 ? 1.0 : 0.0;
}

double FeatureVarianceLargerThanStd(const Series &series, const ParameterMap &, FeatureCache &cache) {
	double variance = ComputeVariance(series, cache);
	if (!std::isfinite(variance)) {
		return NaN();
	}
	return variance > std::sqrt(variance) ? 1.0 : 0.0;
}

double FeatureLargeStandardDeviation(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	if (series.empty()) {
		return NaN();
	}
	double r = param.GetDouble("r").value_or(0.25);
	const auto &sorted = ComputeSorted(series, cache);
	return ComputeStdDev(series, cache) > r * (sorted.back() - sorted.front()) ? 1.0 : 0.0;
}

double FeatureSymmetryLooking(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	if (series.empty()) {
		return NaN();
	}
	double r = param.GetDouble("r").value_or(0.05);
	const auto &sorted = ComputeSorted(series, cache);
	double range = sorted.back() - sorted.front();
	return std::fabs(ComputeMean(series, cache) - ComputeMedian(series, cache)) < r * range ? 1.0 : 0.0;
}

double FeaturePercentageOfReoccurringValues(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	std::unordered_map<double, size_t> counts;
	for (double value : series) {
		counts[value]++;
	}
	auto reoccurring = std::count_if(counts.begin(), counts.end(), [](const auto &kv) { return kv.second > 1; });
	return static_cast<double>(reoccurring) / static_cast<double>(counts.size());
}

double FeatureSumOfReoccurringValues(const Series &series, const ParameterMap &, FeatureCache &) {
	std::unordered_map<double, size_t> counts;
	for (double value : series) {
		counts[value]++;
	}
	double sum = 0.0;
	for (const auto &kv : counts) {
		if (kv.second > 1) {
			sum += kv.first;
		}
	}
	return sum;
}

double FeatureRatioValueNumberToSeriesLength(const Series &series, const ParameterMap &, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	std::unordered_map<double, size_t> counts;
	for (double value : series) {
		counts[value]++;
	}
	return static_cast<double>(counts.size()) / static_cast<double>(series.size());
}

double FeatureCountAbove(const Series &series, const ParameterMap &param, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	double t = param.GetDouble("t").value_or(0.0);
	auto count = std::count_if(series.begin(), series.end(), [&](double value) { return value > t; });
	return static_cast<double>(count) / static_cast<double>(series.size());
}

double FeatureCountBelow(const Series &series, const ParameterMap &param, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	double t = param.GetDouble("t").value_or(0.0);
	auto count = std::count_if(series.begin(), series.end(), [&](double value) { return value < t; });
	return static_cast<double>(count) / static_cast<double>(series.size());
}

double FeatureC3(const Series &series, const ParameterMap &param, FeatureCache &) {
	auto lag = static_cast<size_t>(param.GetInt("lag").value_or(1));
	if (lag == 0 || series.size() <= 2 * lag) {
		return NaN();
	}
	double sum = 0.0;
	for (size_t i = 2 * lag; i < series.size(); ++i) {
		sum += series[i] * series[i - lag] * series[i - 2 * lag];
	}
	return sum / static_cast<double>(series.size() - 2 * lag);
}

double FeatureTimeReversalAsymmetryStatistic(const Series &series, const ParameterMap &param, FeatureCache &) {
	auto lag = static_cast<size_t>(param.GetInt("lag").value_or(1));
	if (lag == 0 || 2 * lag >= series.size()) {
		return 0.0;
	}
	double sum = 0.0;
	for (size_t i = 0; i + 2 * lag < series.size(); ++i) {
		double x0 = series[i];
		double x1 = series[i + lag];
		double x2 = series[i + 2 * lag];
		sum += x2 * x2 * x1 - x1 * x0 * x0;
	}
	return sum / static_cast<double>(series.size() - 2 * lag);
}

// Counts samples larger than their n neighbours on both sides.
double FeatureNumberPeaks(const Series &series, const ParameterMap &param, FeatureCache &) {
	auto n = static_cast<size_t>(param.GetInt("n").value_or(1));
	if (n == 0 || series.size() < 2 * n + 1) {
		return 0.0;
	}
	size_t count = 0;
	for (size_t i = n; i + n < series.size(); ++i) {
		bool peak = true;
		for (size_t j = 1; j <= n && peak; ++j) {
			peak = series[i] > series[i - j] && series[i] > series[i + j];
		}
		if (peak) {
			++count;
		}
	}
	return static_cast<double>(count);
}

double FeatureIndexMassQuantile(const Series &series, const ParameterMap &param, FeatureCache &) {
	if (series.empty()) {
		return NaN();
	}
	double q = param.GetDouble("q").value_or(0.5);
	double total = 0.0;
	for (double value : series) {
		total += std::fabs(value);
	}
	if (total < 1e-12) {
		return NaN();
	}
	double running = 0.0;
	for (size_t i = 0; i < series.size(); ++i) {
		running += std::fabs(series[i]);
		if (running >= q * total) {
			return static_cast<double>(i + 1) / static_cast<double>(series.size());
		}
	}
	return 1.0;
}

double FeatureMeanNAbsoluteMax(const Series &series, const ParameterMap &param, FeatureCache &cache) {
	auto number = static_cast<size_t>(param.GetInt("number_of_maxima").value_or(7));
	const auto &sorted = ComputeAbsSorted(series, cache);
	if (number == 0 || number > sorted.size()) {
		return NaN();
	}
	return std::accumulate(sorted.end() - static_cast<std::ptrdiff_t>(number), sorted.end(), 0.0) /
	       static_cast<double>(number);
}

double FeatureBinnedEntropy(const Series &series, const ParameterMap &param, FeatureCache &) {
	auto bins = static_cast<size_t>(param.GetInt("max_bins").value_or(10));
	if (series.empty() || bins == 0) {
		return NaN();
	}
	auto minmax = std::minmax_element(series.begin(), series.end());
	double min_val = *minmax.first;
	double max_val = *minmax.second;
	if (std::fabs(max_val - min_val) < 1e-12) {
		return 0.0;
	}
	std::vector<size_t> histogram(bins, 0);
	for (double value : series) {
		auto idx = static_cast<size_t>(std::floor((value - min_val) / (max_val - min_val) * static_cast<double>(bins)));
		++histogram[std::min(idx, bins - 1)];
	}
	double entropy = 0.0;
	for (size_t count : histogram) {
		if (count > 0) {
			double p = static_cast<double>(count) / static_cast<double>(series.size());
			entropy -= p * std::log(p);
		}
	}
	return entropy;
}

std::vector<ParameterMap> LagParams(int64_t from, int64_t to, const std::string &key = "lag") {
	std::vector<ParameterMap> params;
	for (int64_t lag = from; lag <= to; ++lag) {
		params.push_back(Params({{key, lag}}));
	}
	return params;
}

std::vector<ParameterMap> StepParams(const std::string &key, int steps, double step) {
	std::vector<ParameterMap> params;
	for (int i = 1; i <= steps; ++i) {
		params.push_back(Params({{key, i * step}}));
	}
	return params;
}

} // namespace

void RegisterBuiltinFeatureCalculators(FeatureRegistry &registry) {
	auto simple = [&](const std::string &name, FeatureCalculatorFn fn) {
		FeatureDefinition def;
		def.name = name;
		def.calculator = std::move(fn);
		registry.Register(std::move(def));
	};
	auto with_params = [&](const std::string &name, std::vector<ParameterMap> params, FeatureCalculatorFn fn) {
		FeatureDefinition def;
		def.name = name;
		def.default_parameters = std::move(params);
		def.calculator = std::move(fn);
		registry.Register(std::move(def));
	};

	simple("sum_values", FeatureSumValues);
	simple("median", FeatureMedian);
	simple("mean", FeatureMean);
	simple("length", FeatureLength);
	simple("standard_deviation", FeatureStandardDeviation);
	simple("variance", FeatureVariance);
	simple("root_mean_square", FeatureRootMeanSquare);
	simple("maximum", FeatureMaximum);
	simple("absolute_maximum", FeatureAbsoluteMaximum);
	simple("minimum", FeatureMinimum);

	simple("skewness", FeatureSkewness);
	simple("kurtosis", FeatureKurtosis);
	simple("abs_energy", FeatureAbsEnergy);
	simple("mean_abs_change", FeatureMeanAbsChange);
	simple("mean_change", FeatureMeanChange);
	simple("mean_second_derivative_central", FeatureMeanSecondDerivativeCentral);
	simple("absolute_sum_of_changes", FeatureAbsoluteSumOfChanges);
	with_params("cid_ce", {Params({{"normalize", true}}), Params({{"normalize", false}})}, FeatureCidCe);
	simple("variation_coefficient", FeatureVariationCoefficient);
	simple("count_above_mean", FeatureCountAboveMean);
	simple("count_below_mean", FeatureCountBelowMean);
	simple("longest_strike_above_mean", FeatureLongestStrikeAboveMean);
	simple("longest_strike_below_mean", FeatureLongestStrikeBelowMean);
	simple("first_location_of_maximum", FeatureFirstLocationOfMaximum);
	simple("last_location_of_maximum", FeatureLastLocationOfMaximum);
	simple("first_location_of_minimum", FeatureFirstLocationOfMinimum);
	simple("last_location_of_minimum", FeatureLastLocationOfMinimum);
	with_params("ratio_beyond_r_sigma",
	            {Params({{"r", 0.5}}), Params({{"r", 1.0}}), Params({{"r", 1.5}}), Params({{"r", 2.0}}),
	             Params({{"r", 2.5}}), Params({{"r", 3.0}}), Params({{"r", 5.0}}), Params({{"r", 6.0}}),
	             Params({{"r", 7.0}}), Params({{"r", 10.0}})},
	            FeatureRatioBeyondRSigma);
	with_params("quantile", StepParams("q", 9, 0.1), FeatureQuantile);
	with_params("autocorrelation", LagParams(0, 9), FeatureAutocorrelation);
	with_params("linear_trend",
	            {Params({{"attr", std::string("intercept")}}), Params({{"attr", std::string("rvalue")}}),
	             Params({{"attr", std::string("slope")}}), Params({{"attr", std::string("stderr")}})},
	            FeatureLinearTrend);
	with_params("number_crossing_m", {Params({{"m", 0.0}}), Params({{"m", -1.0}}), Params({{"m", 1.0}})},
	            FeatureNumberCrossingM);
	simple("has_duplicate", FeatureHasDuplicate);
	simple("has_duplicate_max", FeatureHasDuplicateMax);
	simple("has_duplicate_min", FeatureHasDuplicateMin);

	simple("variance_larger_than_standard_deviation", FeatureVarianceLargerThanStd);
	with_params("large_standard_deviation", StepParams("r", 19, 0.05), FeatureLargeStandardDeviation);
	with_params("symmetry_looking", StepParams("r", 19, 0.05), FeatureSymmetryLooking);
	simple("percentage_of_reoccurring_values_to_all_values", FeaturePercentageOfReoccurringValues);
	simple("sum_of_reoccurring_values", FeatureSumOfReoccurringValues);
	simple("ratio_value_number_to_time_series_length", FeatureRatioValueNumberToSeriesLength);
	with_params("count_above", {Params({{"t", 0.0}})}, FeatureCountAbove);
	with_params("count_below", {Params({{"t", 0.0}})}, FeatureCountBelow);
	with_params("c3", LagParams(1, 3), FeatureC3);
	with_params("time_reversal_asymmetry_statistic", LagParams(1, 3), FeatureTimeReversalAsymmetryStatistic);
	with_params("number_peaks", {Params({{"n", int64_t {1}}}), Params({{"n", int64_t {3}}}),
	                             Params({{"n", int64_t {5}}}), Params({{"n", int64_t {10}}}),
	                             Params({{"n", int64_t {50}}})},
	            FeatureNumberPeaks);
	with_params("index_mass_quantile", StepParams("q", 9, 0.1), FeatureIndexMassQuantile);
	with_params("mean_n_absolute_max", {Params({{"number_of_maxima", int64_t {7}}})}, FeatureMeanNAbsoluteMax);
	with_params("binned_entropy", {Params({{"max_bins", int64_t {10}}})}, FeatureBinnedEntropy);
}

} // namespace procchain::features
