#include "procchain/transform/aligner.hpp"
#include "procchain/core/errors.hpp"

#include <algorithm>

namespace procchain::transform {

std::string_view cutoffPositionName(CutoffPosition position) {
	return position == CutoffPosition::Pre ? "pre" : "post";
}

std::optional<CutoffPosition> parseCutoffPosition(std::string_view name) {
	if (name == "pre") {
		return CutoffPosition::Pre;
	}
	if (name == "post") {
		return CutoffPosition::Post;
	}
	return std::nullopt;
}

core::Series align(const core::Series &series, const AlignmentSpec &spec) {
	if (spec.target_length <= 0) {
		throw core::ConfigError("Alignment target length must be positive, got " +
		                        std::to_string(spec.target_length) + ".");
	}
	const auto target = static_cast<size_t>(spec.target_length);
	const size_t length = series.size();

	if (length >= target) {
		if (spec.cutoff == CutoffPosition::Post) {
			return core::Series(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(target));
		}
		return core::Series(series.end() - static_cast<std::ptrdiff_t>(target), series.end());
	}

	core::Series result(target, spec.padding_value);
	if (spec.cutoff == CutoffPosition::Post) {
		std::copy(series.begin(), series.end(), result.begin());
	} else {
		std::copy(series.begin(), series.end(), result.begin() + static_cast<std::ptrdiff_t>(target - length));
	}
	return result;
}

LengthAligner::LengthAligner(AlignmentSpec spec) : spec_(spec) {
	if (spec_.target_length <= 0) {
		throw core::ConfigError("Alignment target length must be positive, got " +
		                        std::to_string(spec_.target_length) + ".");
	}
}

void LengthAligner::fit(const core::Series &) {
}

void LengthAligner::transform(core::Series &data) const {
	data = align(data, spec_);
}

std::string LengthAligner::getName() const {
	return "align(" + std::to_string(spec_.target_length) + "," + std::string(cutoffPositionName(spec_.cutoff)) + ")";
}

} // namespace procchain::transform
