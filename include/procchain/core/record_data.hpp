#pragma once

#include "procchain/core/types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace procchain::core {

/**
 * @class StaticAttributes
 * @brief Scalar metadata and summary measurements of one recording.
 *
 * Lookups are explicit: find() reports absence with a null pointer, at()
 * throws std::out_of_range.
 */
class StaticAttributes {
public:
	void set(std::string name, StaticValue value);

	bool has(std::string_view name) const;
	const StaticValue *find(std::string_view name) const;
	const StaticValue &at(std::string_view name) const;

	std::optional<double> getNumber(std::string_view name) const;
	std::optional<std::string> getText(std::string_view name) const;

	std::vector<std::string> names() const;
	std::size_t size() const noexcept {
		return values_.size();
	}
	bool empty() const noexcept {
		return values_.empty();
	}

private:
	std::map<std::string, StaticValue, std::less<>> values_;
};

/// One tightening step of a screw-driving run, as a range of sample indices.
struct StepSegment {
	std::string name;
	std::size_t begin = 0;
	std::size_t count = 0;
};

/**
 * @class SerialSeries
 * @brief Named measurement sequences of one recording plus their shared time axis.
 *
 * A series that exists in the recording's schema but had no samples in the
 * source is stored as an empty sequence, so has() is true for it.
 */
class SerialSeries {
public:
	void set(std::string name, Series values);
	void setTimeAxis(Series time);
	void setSteps(std::vector<StepSegment> steps);

	bool has(std::string_view name) const;
	const Series *find(std::string_view name) const;
	const Series &at(std::string_view name) const;

	const Series &timeAxis() const noexcept {
		return time_;
	}
	bool hasTimeAxis() const noexcept {
		return !time_.empty();
	}
	const std::vector<StepSegment> &steps() const noexcept {
		return steps_;
	}

	std::vector<std::string> names() const;
	std::size_t size() const noexcept {
		return series_.size();
	}

private:
	std::map<std::string, Series, std::less<>> series_;
	Series time_;
	std::vector<StepSegment> steps_;
};

/// What a source parser produces for one recording.
struct RawRecording {
	StaticAttributes static_data;
	SerialSeries serial_data;
};

} // namespace procchain::core
