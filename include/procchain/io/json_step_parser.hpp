#pragma once

#include "procchain/io/data_source.hpp"

namespace procchain::io {

/**
 * @class JsonStepParser
 * @brief Screw-driving runs stored as a "tightening steps" array.
 *
 * Each step holds a "graph" object with "<channel> values" arrays. The
 * steps are concatenated; within a step every channel is brought to the
 * length of the step's time values (NaN fill or truncation), so all
 * channels share one grid. Channels that no step carries stay empty.
 *
 * The static attributes of the result hold step_count and step_names
 * (names joined by '|').
 */
class JsonStepParser final : public IRecordParser {
public:
	core::RawRecording parse(std::istream &input, const core::RecordingSchema &schema) const override;
};

} // namespace procchain::io
