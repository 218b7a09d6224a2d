#include "procchain/io/delimited_text_parser.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/text.hpp"

#include <cmath>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace procchain::io {

namespace {

// Adds the schema series the source did not provide as empty sequences.
void addMissingSeries(core::SerialSeries &serial, const core::RecordingSchema &schema) {
	for (const auto &name : schema.series) {
		if (!serial.has(name)) {
			serial.set(name, {});
		}
	}
}

double parseValue(std::string_view field, bool allow_decimal_comma, std::size_t line_number) {
	auto trimmed = utils::trim(field);
	if (trimmed.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (auto value = utils::parseDouble(trimmed)) {
		return *value;
	}
	if (allow_decimal_comma && utils::contains(trimmed, ",")) {
		std::string dotted(trimmed);
		for (auto &c : dotted) {
			if (c == ',') {
				c = '.';
			}
		}
		if (auto value = utils::parseDouble(dotted)) {
			return *value;
		}
	}
	throw core::ParseError("line " + std::to_string(line_number) + ": '" + std::string(trimmed) +
	                       "' is not a number.");
}

} // namespace

CsvTableParser::CsvTableParser(char delimiter) : delimiter_(delimiter) {
}

core::RawRecording CsvTableParser::parse(std::istream &input, const core::RecordingSchema &schema) const {
	std::string line;
	std::size_t line_number = 0;
	std::vector<std::string> header;
	while (std::getline(input, line)) {
		++line_number;
		if (!utils::trim(line).empty()) {
			header = utils::splitRecord(line, delimiter_);
			break;
		}
	}
	if (header.size() < 2) {
		throw core::ParseError("Serial table has no header row.");
	}

	// Column 0 is the row index.
	std::vector<core::Series> columns(header.size() - 1);
	while (std::getline(input, line)) {
		++line_number;
		if (utils::trim(line).empty()) {
			continue;
		}
		auto fields = utils::splitRecord(line, delimiter_);
		if (fields.size() != header.size()) {
			throw core::ParseError("line " + std::to_string(line_number) + ": expected " +
			                       std::to_string(header.size()) + " fields, found " +
			                       std::to_string(fields.size()) + ".");
		}
		for (std::size_t i = 1; i < fields.size(); ++i) {
			columns[i - 1].push_back(parseValue(fields[i], false, line_number));
		}
	}

	core::RawRecording recording;
	auto &serial = recording.serial_data;
	for (std::size_t i = 1; i < header.size(); ++i) {
		auto name = std::string(utils::trim(header[i]));
		if (name == schema.time_series) {
			serial.setTimeAxis(std::move(columns[i - 1]));
		} else {
			serial.set(std::move(name), std::move(columns[i - 1]));
		}
	}
	addMissingSeries(serial, schema);
	return recording;
}

MarkedTextParser::MarkedTextParser(char delimiter) : delimiter_(delimiter) {
}

core::RawRecording MarkedTextParser::parse(std::istream &input, const core::RecordingSchema &schema) const {
	const auto &names = schema.source_columns;
	if (names.empty()) {
		throw std::invalid_argument("MarkedTextParser requires source columns in the recording schema.");
	}

	std::string line;
	std::size_t line_number = 0;
	bool found_marker = false;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::contains(line, kDataMarker)) {
			found_marker = true;
			break;
		}
	}
	if (!found_marker) {
		throw core::ParseError(std::string("No '") + kDataMarker + "' line found.");
	}

	std::vector<core::Series> columns(names.size());
	bool decimal_comma = delimiter_ != ',';
	while (std::getline(input, line)) {
		++line_number;
		auto trimmed = utils::trim(line);
		if (trimmed.empty()) {
			continue;
		}
		auto fields = utils::splitRecord(trimmed, delimiter_);
		if (fields.size() == names.size() + 1 && utils::trim(fields.back()).empty()) {
			fields.pop_back();
		}
		if (fields.size() != names.size()) {
			throw core::ParseError("line " + std::to_string(line_number) + ": expected " +
			                       std::to_string(names.size()) + " values, found " + std::to_string(fields.size()) +
			                       ".");
		}
		for (std::size_t i = 0; i < fields.size(); ++i) {
			columns[i].push_back(parseValue(fields[i], decimal_comma, line_number));
		}
	}

	core::RawRecording recording;
	auto &serial = recording.serial_data;
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (names[i] == schema.time_series) {
			serial.setTimeAxis(std::move(columns[i]));
		} else {
			serial.set(names[i], std::move(columns[i]));
		}
	}
	addMissingSeries(serial, schema);
	return recording;
}

} // namespace procchain::io
