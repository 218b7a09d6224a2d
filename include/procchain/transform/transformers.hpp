#pragma once

#include "procchain/transform/transformer.hpp"

#include <optional>

namespace procchain::transform {

/// How negative samples are treated by NegativeValueReplacer.
struct NegativeReplacement {
	enum class Mode {
		Value,
		Null,
		Keep
	};

	Mode mode = Mode::Value;
	double value = 0.0;

	static NegativeReplacement withValue(double value) {
		return {Mode::Value, value};
	}
	static NegativeReplacement null() {
		return {Mode::Null, 0.0};
	}
	static NegativeReplacement keep() {
		return {Mode::Keep, 0.0};
	}
};

/// Replaces every value < 0 by a number or NaN, or leaves the series alone.
class NegativeValueReplacer final : public Transformer {
public:
	explicit NegativeValueReplacer(NegativeReplacement replacement);

	void fit(const core::Series &data) override;
	void transform(core::Series &data) const override;
	std::string getName() const override;

private:
	NegativeReplacement replacement_;
};

/**
 * @class UniformTimeResampler
 * @brief Linearly interpolates a series onto an evenly spaced time grid.
 *
 * The grid starts at min(time) and advances by the target distance; grid
 * points are rounded to four decimals and never exceed max(time). When
 * resampling is impossible (no or mismatched time axis, fewer than two
 * samples, a grid of fewer than two points) the series is left unchanged
 * and a warning is logged.
 */
class UniformTimeResampler final : public Transformer {
public:
	UniformTimeResampler(core::Series time_axis, double target_distance);

	void fit(const core::Series &data) override;
	void transform(core::Series &data) const override;
	std::string getName() const override;

	/// Grid the series would be resampled onto; empty when resampling is impossible.
	core::Series grid() const;

private:
	double interpolate(const core::Series &data, double target_time) const;

	core::Series time_;
	double target_distance_;
};

struct StandardScaleParams {
	double mean = 0.0;
	double std_dev = 1.0;

	/// Population mean and standard deviation.
	/// @throws core::DataQualityError on non-finite data.
	static StandardScaleParams fromData(const core::Series &data);
};

/**
 * @class StandardScaler
 * @brief Z-score normalization with the population standard deviation.
 *
 * Fitting on data with non-finite values or zero spread raises
 * core::DataQualityError.
 */
class StandardScaler final : public Transformer {
public:
	StandardScaler() = default;

	StandardScaler &withParameters(StandardScaleParams params);

	void fit(const core::Series &data) override;
	void transform(core::Series &data) const override;
	std::string getName() const override;

	const std::optional<StandardScaleParams> &parameters() const noexcept {
		return params_;
	}

private:
	void ensureParams() const;

	std::optional<StandardScaleParams> params_;
};

} // namespace procchain::transform
