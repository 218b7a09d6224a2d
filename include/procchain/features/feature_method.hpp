#pragma once

#include "procchain/features/feature_types.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace procchain::features {

/// Series passed through unchanged.
struct RawParams {};

/// Piecewise aggregate approximation into a fixed number of segment means.
struct PaaParams {
	int64_t segments = 0;
};

/// Named statistical calculators, either a whole set or an explicit list.
struct StatisticalParams {
	FeatureSet feature_set = FeatureSet::Efficient;
	/// When non-empty, replaces the feature set.
	std::vector<std::string> features;
};

/// catch22 descriptors, optionally extended to catch24.
struct CanonicalParams {
	bool catch24 = false;
};

using MethodParams = std::variant<RawParams, PaaParams, StatisticalParams, CanonicalParams>;

struct FeatureMethodSpec {
	MethodParams params = RawParams {};
	/// Z-score the series before extraction.
	bool normalize = false;
};

std::string_view MethodName(const MethodParams &params);

struct ExtractionResult {
	enum class Shape {
		/// values is the whole (possibly normalized) series; one column.
		Passthrough,
		/// values[i] becomes column suffix _i.
		Indexed,
		/// values[i] becomes column suffix _names[i].
		Named
	};

	Shape shape = Shape::Passthrough;
	Series values;
	std::vector<std::string> names;
};

/**
 * @struct FeatureLibrary
 * @brief The feature functions extraction delegates to.
 *
 * Both callables are replaceable so callers can plug in other
 * implementations; Default() binds the built-in registry and catch22.
 */
struct FeatureLibrary {
	std::function<std::vector<FeatureResult>(const Series &, const StatisticalParams &)> statistical;
	std::function<std::vector<double>(const Series &, bool catch24)> canonical;

	static FeatureLibrary Default();
};

/**
 * @brief Means of `segments` contiguous chunks.
 *
 * Chunk sizes are len / segments, the first len % segments chunks taking
 * one extra sample.
 *
 * @throws core::ConfigError unless 1 <= segments <= series.size().
 */
Series PiecewiseAggregate(const Series &series, int64_t segments);

/// Runs the built-in statistical registry.
std::vector<FeatureResult> StatisticalFeatures(const Series &series, const StatisticalParams &params);

/**
 * @brief Checks parameters that can be validated without data.
 * @throws core::ConfigError for a non-positive PAA segment count or an unknown statistical feature.
 */
void ValidateMethodSpec(const FeatureMethodSpec &spec);

/**
 * @brief Column suffixes ExtractFeatures produces for a spec with the default library.
 *
 * Raw yields one empty suffix, indexed methods "_0" .. "_{n-1}" and
 * statistical methods "_" plus each feature name.
 */
std::vector<std::string> PlannedColumnSuffixes(const FeatureMethodSpec &spec);

/**
 * @brief Applies one feature method to a series.
 *
 * @throws core::DataQualityError when normalize is set and the series has
 *         non-finite values or zero standard deviation.
 * @throws core::ConfigError for PAA segment counts outside [1, len].
 */
ExtractionResult ExtractFeatures(const Series &series, const FeatureMethodSpec &spec, const FeatureLibrary &library);

} // namespace procchain::features
