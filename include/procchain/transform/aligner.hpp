#pragma once

#include "procchain/core/types.hpp"
#include "procchain/transform/transformer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace procchain::transform {

/// Which end of the series is anchored when truncating or padding.
enum class CutoffPosition {
	/// Keep the tail; pad at the start.
	Pre,
	/// Keep the head; pad at the end.
	Post
};

std::string_view cutoffPositionName(CutoffPosition position);
std::optional<CutoffPosition> parseCutoffPosition(std::string_view name);

struct AlignmentSpec {
	int64_t target_length = 0;
	CutoffPosition cutoff = CutoffPosition::Post;
	double padding_value = 0.0;
};

/**
 * @brief Brings a series to exactly spec.target_length samples.
 *
 * Longer series are truncated, shorter ones padded with spec.padding_value,
 * both at the end opposite the anchor. Aligning an aligned series is a no-op.
 *
 * @throws core::ConfigError if spec.target_length <= 0.
 */
core::Series align(const core::Series &series, const AlignmentSpec &spec);

/// Pipeline step wrapping align().
class LengthAligner final : public Transformer {
public:
	explicit LengthAligner(AlignmentSpec spec);

	void fit(const core::Series &data) override;
	void transform(core::Series &data) const override;
	std::string getName() const override;

	const AlignmentSpec &spec() const noexcept {
		return spec_;
	}

private:
	AlignmentSpec spec_;
};

} // namespace procchain::transform
