#include "procchain/io/json_step_parser.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/text.hpp"

#include <nlohmann/json.hpp>

#include <istream>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace procchain::io {

namespace {

using nlohmann::json;

constexpr const char *kStepsKey = "tightening steps";
constexpr const char *kGraphKey = "graph";

std::string valuesKey(const std::string &channel) {
	return channel + " values";
}

core::Series readValues(const json &array, const std::string &where) {
	if (!array.is_array()) {
		throw core::ParseError(where + " is not an array.");
	}
	core::Series values;
	values.reserve(array.size());
	for (const auto &item : array) {
		if (item.is_number()) {
			values.push_back(item.get<double>());
		} else if (item.is_null()) {
			values.push_back(std::numeric_limits<double>::quiet_NaN());
		} else {
			throw core::ParseError(where + " holds a non-numeric value.");
		}
	}
	return values;
}

std::string stepName(const json &step, std::size_t index) {
	for (const char *key : {"name", "step name"}) {
		auto it = step.find(key);
		if (it != step.end() && it->is_string()) {
			return it->get<std::string>();
		}
	}
	return "step_" + std::to_string(index);
}

} // namespace

core::RawRecording JsonStepParser::parse(std::istream &input, const core::RecordingSchema &schema) const {
	json document;
	try {
		document = json::parse(input);
	} catch (const json::parse_error &e) {
		throw core::ParseError(std::string("Invalid JSON: ") + e.what());
	}
	if (!document.is_object()) {
		throw core::ParseError("Screw run document must be a JSON object.");
	}

	json steps = json::array();
	auto steps_it = document.find(kStepsKey);
	if (steps_it != document.end()) {
		if (!steps_it->is_array()) {
			throw core::ParseError(std::string("'") + kStepsKey + "' is not an array.");
		}
		steps = *steps_it;
	}

	const auto nan = std::numeric_limits<double>::quiet_NaN();
	core::Series time;
	std::map<std::string, core::Series> channels;
	std::map<std::string, bool> seen;
	std::vector<core::StepSegment> segments;

	for (std::size_t s = 0; s < steps.size(); ++s) {
		const auto &step = steps[s];
		if (!step.is_object()) {
			throw core::ParseError("Tightening step " + std::to_string(s) + " is not an object.");
		}
		json graph = json::object();
		auto graph_it = step.find(kGraphKey);
		if (graph_it != step.end()) {
			if (!graph_it->is_object()) {
				throw core::ParseError("Tightening step " + std::to_string(s) + ": 'graph' is not an object.");
			}
			graph = *graph_it;
		}

		auto where = "Tightening step " + std::to_string(s);
		core::Series step_time;
		auto time_it = graph.find(valuesKey(schema.time_series));
		if (time_it != graph.end()) {
			step_time = readValues(*time_it, where + " '" + time_it.key() + "'");
		}
		const auto count = step_time.size();
		const auto begin = time.size();

		for (const auto &name : schema.series) {
			auto &channel = channels[name];
			channel.resize(begin, nan);
			auto it = graph.find(valuesKey(name));
			if (it == graph.end()) {
				channel.resize(begin + count, nan);
				continue;
			}
			seen[name] = true;
			auto values = readValues(*it, where + " '" + it.key() + "'");
			values.resize(count, nan);
			channel.insert(channel.end(), values.begin(), values.end());
		}
		time.insert(time.end(), step_time.begin(), step_time.end());
		segments.push_back({stepName(step, s), begin, count});
	}

	core::RawRecording recording;
	auto &serial = recording.serial_data;
	for (const auto &name : schema.series) {
		if (seen[name]) {
			serial.set(name, std::move(channels[name]));
		} else {
			serial.set(name, {});
		}
	}
	serial.setTimeAxis(std::move(time));

	std::vector<std::string> names;
	names.reserve(segments.size());
	for (const auto &segment : segments) {
		names.push_back(segment.name);
	}
	recording.static_data.set("step_count", static_cast<int64_t>(segments.size()));
	recording.static_data.set("step_names", utils::join(names, "|"));
	serial.setSteps(std::move(segments));
	return recording;
}

} // namespace procchain::io
