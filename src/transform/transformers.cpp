#include "procchain/transform/transformers.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/logging.hpp"
#include "procchain/utils/text.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace procchain::transform {

// ============================================================================
// NegativeValueReplacer
// ============================================================================

NegativeValueReplacer::NegativeValueReplacer(NegativeReplacement replacement) : replacement_(replacement) {
}

void NegativeValueReplacer::fit(const core::Series &) {
}

void NegativeValueReplacer::transform(core::Series &data) const {
	if (replacement_.mode == NegativeReplacement::Mode::Keep) {
		return;
	}
	const double substitute = replacement_.mode == NegativeReplacement::Mode::Null
	                              ? std::numeric_limits<double>::quiet_NaN()
	                              : replacement_.value;
	for (double &value : data) {
		if (value < 0.0) {
			value = substitute;
		}
	}
}

std::string NegativeValueReplacer::getName() const {
	switch (replacement_.mode) {
	case NegativeReplacement::Mode::Keep:
		return "remove_negative_values(keep)";
	case NegativeReplacement::Mode::Null:
		return "remove_negative_values(null)";
	case NegativeReplacement::Mode::Value:
	default:
		return "remove_negative_values(" + utils::formatNumber(replacement_.value) + ")";
	}
}

// ============================================================================
// UniformTimeResampler
// ============================================================================

UniformTimeResampler::UniformTimeResampler(core::Series time_axis, double target_distance)
    : time_(std::move(time_axis)), target_distance_(target_distance) {
	if (!(target_distance_ > 0.0) || !std::isfinite(target_distance_)) {
		throw core::ConfigError("Resampling target distance must be a positive number.");
	}
}

void UniformTimeResampler::fit(const core::Series &) {
}

core::Series UniformTimeResampler::grid() const {
	if (time_.size() < 2) {
		return {};
	}
	const auto [min_it, max_it] = std::minmax_element(time_.begin(), time_.end());
	const double start = *min_it;
	const double end = *max_it;
	if (!std::isfinite(start) || !std::isfinite(end)) {
		return {};
	}

	const auto points = static_cast<size_t>((end - start) / target_distance_) + 1;
	core::Series grid;
	grid.reserve(points);
	for (size_t i = 0; i < points; ++i) {
		const double t = std::round((start + static_cast<double>(i) * target_distance_) * 1e4) / 1e4;
		if (t <= end) {
			grid.push_back(t);
		}
	}
	if (grid.size() < 2) {
		return {};
	}
	return grid;
}

double UniformTimeResampler::interpolate(const core::Series &data, double target_time) const {
	if (target_time <= time_.front()) {
		return data.front();
	}
	if (target_time >= time_.back()) {
		return data.back();
	}
	for (size_t i = 0; i + 1 < time_.size(); ++i) {
		const double t0 = time_[i];
		const double t1 = time_[i + 1];
		if (t0 <= target_time && target_time <= t1) {
			if (t1 == t0) {
				return data[i];
			}
			const double weight = (target_time - t0) / (t1 - t0);
			return data[i] + (data[i + 1] - data[i]) * weight;
		}
	}
	return data.back();
}

void UniformTimeResampler::transform(core::Series &data) const {
	if (time_.empty()) {
		PROCCHAIN_WARN("Skipping uniform resampling: recording has no time axis");
		return;
	}
	if (time_.size() != data.size()) {
		PROCCHAIN_WARN("Skipping uniform resampling: time axis has {} samples, series has {}", time_.size(),
		               data.size());
		return;
	}
	if (data.size() < 2) {
		PROCCHAIN_WARN("Skipping uniform resampling: need at least 2 samples, got {}", data.size());
		return;
	}
	const auto points = grid();
	if (points.empty()) {
		PROCCHAIN_WARN("Skipping uniform resampling: grid with distance {} has fewer than 2 points", target_distance_);
		return;
	}

	core::Series resampled;
	resampled.reserve(points.size());
	for (double t : points) {
		resampled.push_back(interpolate(data, t));
	}
	data = std::move(resampled);
}

std::string UniformTimeResampler::getName() const {
	return "resample_uniform_times(" + utils::formatNumber(target_distance_) + ")";
}

// ============================================================================
// StandardScaler
// ============================================================================

StandardScaleParams StandardScaleParams::fromData(const core::Series &data) {
	StandardScaleParams params;
	if (data.empty()) {
		throw core::DataQualityError("Cannot normalize an empty series.");
	}

	double sum = 0.0;
	for (double value : data) {
		if (!std::isfinite(value)) {
			throw core::DataQualityError("Cannot normalize a series containing non-finite values.");
		}
		sum += value;
	}
	params.mean = sum / static_cast<double>(data.size());

	double variance = 0.0;
	for (double value : data) {
		const double diff = value - params.mean;
		variance += diff * diff;
	}
	params.std_dev = std::sqrt(variance / static_cast<double>(data.size()));
	return params;
}

StandardScaler &StandardScaler::withParameters(StandardScaleParams params) {
	params_ = params;
	return *this;
}

void StandardScaler::fit(const core::Series &data) {
	auto params = StandardScaleParams::fromData(data);
	if (!(params.std_dev > 0.0)) {
		throw core::DataQualityError("Cannot normalize a series with zero standard deviation.");
	}
	params_ = params;
}

void StandardScaler::transform(core::Series &data) const {
	ensureParams();
	for (double &value : data) {
		value = (value - params_->mean) / params_->std_dev;
	}
}

std::string StandardScaler::getName() const {
	return "standard_scale";
}

void StandardScaler::ensureParams() const {
	if (!params_.has_value()) {
		throw std::runtime_error("StandardScaler must be fitted before transform");
	}
}

} // namespace procchain::transform
