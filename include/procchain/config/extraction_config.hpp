#pragma once

#include "procchain/core/types.hpp"
#include "procchain/features/feature_method.hpp"
#include "procchain/transform/aligner.hpp"
#include "procchain/transform/transformer.hpp"
#include "procchain/transform/transformers.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procchain::config {

/// Where a configured name is looked up in a recording.
enum class SeriesSource {
	/// Serial data first, static attributes when only they have the name.
	Auto,
	Serial,
	Static
};

std::string_view seriesSourceName(SeriesSource source);
std::optional<SeriesSource> parseSeriesSource(std::string_view name);

/// What happens when a method cannot tolerate the data of one entry.
enum class DataQualityPolicy {
	Raise,
	Skip
};

std::optional<DataQualityPolicy> parseDataQualityPolicy(std::string_view name);

/// Value preprocessing applied to one series before extraction, in declaration order.
struct PreprocessingSpec {
	std::optional<transform::NegativeReplacement> negative_values;
	std::optional<double> resample_distance;
	std::optional<transform::AlignmentSpec> alignment;

	bool empty() const noexcept {
		return !negative_values && !resample_distance && !alignment;
	}

	/**
	 * @brief Builds the transformer chain for one series.
	 * @param time_axis The recording's time axis, used by resampling.
	 */
	transform::Pipeline buildPipeline(const core::Series &time_axis) const;
};

struct SeriesEntry {
	core::ProcessKind kind = core::ProcessKind::UpperInjection;
	std::string series_name;
	bool use_series = false;
	SeriesSource source = SeriesSource::Auto;
	features::FeatureMethodSpec method;
	PreprocessingSpec preprocessing;
	/// Overrides ExtractionConfig::default_policy when set.
	std::optional<DataQualityPolicy> on_data_quality_error;
};

/**
 * @class ExtractionConfig
 * @brief Ordered (kind, series) entries driving feature extraction.
 *
 * Entry order is the order of the configuration documents and determines
 * column order. Pairs that are not listed produce no output.
 */
struct ExtractionConfig {
	std::vector<SeriesEntry> entries;
	DataQualityPolicy default_policy = DataQualityPolicy::Raise;

	/**
	 * @brief Checks every entry for values no data could satisfy.
	 *
	 * Besides per-entry values this rejects PAA segment counts above a
	 * configured alignment length and entries whose planned columns collide.
	 *
	 * @throws core::ConfigError on the first invalid entry.
	 */
	void validate() const;

	/**
	 * @brief Column names the enabled entries produce, kinds in fixed order.
	 *
	 * Names are {kind}_{series} plus the method's PlannedColumnSuffixes().
	 * Auto entries also list the bare {kind}_{series} column a static value
	 * would produce.
	 */
	std::vector<std::string> plannedColumns() const;

	/// Entries of one kind, in configuration order.
	std::vector<const SeriesEntry *> entriesFor(core::ProcessKind kind) const;

	DataQualityPolicy policyFor(const SeriesEntry &entry) const {
		return entry.on_data_quality_error.value_or(default_policy);
	}
};

} // namespace procchain::config
