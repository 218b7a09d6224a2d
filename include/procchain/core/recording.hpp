#pragma once

#include "procchain/config/extraction_config.hpp"
#include "procchain/core/feature_table.hpp"
#include "procchain/core/record_data.hpp"
#include "procchain/core/types.hpp"
#include "procchain/features/feature_method.hpp"

#include <string>

namespace procchain::core {

/**
 * @class Recording
 * @brief Static and serial data of one process stream for one workpiece.
 *
 * Immutable after loading. getData() runs the configured preprocessing and
 * feature method for every enabled entry of this recording's kind.
 */
class Recording {
public:
	Recording(WorkpieceId workpiece_id, ProcessKind kind, StaticAttributes static_data, SerialSeries serial_data);

	WorkpieceId workpieceId() const noexcept {
		return workpiece_id_;
	}
	ProcessKind kind() const noexcept {
		return kind_;
	}
	const StaticAttributes &staticData() const noexcept {
		return static_;
	}
	const SerialSeries &serialData() const noexcept {
		return serial_;
	}

	/**
	 * @brief Extracts this recording's columns.
	 *
	 * Columns are named {kind}_{series} for raw series and static values,
	 * {kind}_{series}_{i} for paa and canonical features and
	 * {kind}_{series}_{feature} for statistical features. Entries whose
	 * series is absent yield no columns.
	 *
	 * @throws DataQualityError unless the entry's policy is skip.
	 * @throws ConfigError for PAA segment counts exceeding the series length.
	 */
	FeatureRow getData(const config::ExtractionConfig &config,
	                   const features::FeatureLibrary &library = features::FeatureLibrary::Default()) const;

	/**
	 * @brief Columns of a single entry, whatever its kind.
	 *
	 * Under the skip policy a DataQualityError yields an empty row.
	 */
	FeatureRow getEntryData(const config::SeriesEntry &entry, config::DataQualityPolicy policy,
	                        const features::FeatureLibrary &library = features::FeatureLibrary::Default()) const;

	/// Column prefix of one series, e.g. "upper-injection_melt_volume".
	std::string columnPrefix(const std::string &series_name) const;

private:
	// The schema's time axis name resolves to the time axis, ahead of a static attribute of that name.
	const Series *findSeries(const std::string &name) const;
	void extractEntry(const config::SeriesEntry &entry, const features::FeatureLibrary &library, FeatureRow &row) const;

	WorkpieceId workpiece_id_;
	ProcessKind kind_;
	StaticAttributes static_;
	SerialSeries serial_;
};

} // namespace procchain::core
