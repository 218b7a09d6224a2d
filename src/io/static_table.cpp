#include "procchain/io/static_table.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/text.hpp"

#include <fstream>
#include <istream>
#include <stdexcept>

namespace procchain::io {

namespace {

constexpr const char *kWorkpieceIdColumn = "upper_workpiece_id";
constexpr const char *kLocationColumn = "workpiece_location";

bool matchesId(const core::StaticValue &cell, core::WorkpieceId workpiece_id) {
	if (const auto *integer = std::get_if<int64_t>(&cell)) {
		return *integer == workpiece_id;
	}
	if (const auto *text = std::get_if<std::string>(&cell)) {
		return utils::trim(*text) == std::to_string(workpiece_id);
	}
	if (const auto *number = std::get_if<double>(&cell)) {
		return *number == static_cast<double>(workpiece_id);
	}
	return false;
}

} // namespace

core::StaticValue parseCell(std::string_view text) {
	auto trimmed = utils::trim(text);
	if (trimmed.empty()) {
		return std::monostate {};
	}
	if (auto integer = utils::parseInteger(trimmed)) {
		return *integer;
	}
	if (auto number = utils::parseDouble(trimmed)) {
		return *number;
	}
	return std::string(trimmed);
}

StaticTable::StaticTable(std::vector<std::string> columns, std::vector<std::vector<core::StaticValue>> rows)
    : columns_(std::move(columns)), rows_(std::move(rows)) {
	for (const auto &row : rows_) {
		if (row.size() != columns_.size()) {
			throw std::invalid_argument("StaticTable row width does not match the column count.");
		}
	}
}

StaticTable StaticTable::read(std::istream &input, char delimiter, bool index_column, const std::string &origin) {
	std::string line;
	std::size_t line_number = 0;
	std::vector<std::string> columns;
	while (std::getline(input, line)) {
		++line_number;
		if (!utils::trim(line).empty()) {
			columns = utils::splitRecord(line, delimiter);
			break;
		}
	}
	if (columns.empty()) {
		throw core::ParseError(origin + ": missing header row.");
	}
	for (auto &column : columns) {
		column = std::string(utils::trim(column));
	}
	if (index_column) {
		columns.erase(columns.begin());
	}

	std::vector<std::vector<core::StaticValue>> rows;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::trim(line).empty()) {
			continue;
		}
		auto fields = utils::splitRecord(line, delimiter);
		std::size_t offset = index_column ? 1 : 0;
		if (fields.size() != columns.size() + offset) {
			throw core::ParseError(origin + ":" + std::to_string(line_number) + ": expected " +
			                       std::to_string(columns.size() + offset) + " fields, found " +
			                       std::to_string(fields.size()) + ".");
		}
		std::vector<core::StaticValue> row;
		row.reserve(columns.size());
		for (std::size_t i = offset; i < fields.size(); ++i) {
			row.push_back(parseCell(fields[i]));
		}
		rows.push_back(std::move(row));
	}
	return StaticTable(std::move(columns), std::move(rows));
}

StaticTable StaticTable::readFile(const std::string &path, char delimiter, bool index_column) {
	std::ifstream input(path);
	if (!input) {
		throw core::NotFoundError("Static table '" + path + "' not found.");
	}
	return read(input, delimiter, index_column, path);
}

std::optional<std::size_t> StaticTable::columnIndex(std::string_view column) const {
	for (std::size_t i = 0; i < columns_.size(); ++i) {
		if (columns_[i] == column) {
			return i;
		}
	}
	return std::nullopt;
}

const core::StaticValue &StaticTable::value(std::size_t row, std::size_t column) const {
	return rows_.at(row).at(column);
}

std::optional<std::size_t> StaticTable::findWorkpiece(core::WorkpieceId workpiece_id,
                                                      std::string_view location) const {
	auto id_column = columnIndex(kWorkpieceIdColumn);
	if (!id_column) {
		throw core::ParseError(std::string("Static table has no '") + kWorkpieceIdColumn + "' column.");
	}
	std::optional<std::size_t> location_column;
	if (!location.empty()) {
		location_column = columnIndex(kLocationColumn);
		if (!location_column) {
			throw core::ParseError(std::string("Static table has no '") + kLocationColumn + "' column.");
		}
	}
	for (std::size_t row = 0; row < rows_.size(); ++row) {
		if (!matchesId(rows_[row][*id_column], workpiece_id)) {
			continue;
		}
		if (location_column && core::toText(rows_[row][*location_column]) != location) {
			continue;
		}
		return row;
	}
	return std::nullopt;
}

core::StaticAttributes StaticTable::rowAttributes(std::size_t row) const {
	core::StaticAttributes attributes;
	const auto &cells = rows_.at(row);
	for (std::size_t i = 0; i < columns_.size(); ++i) {
		attributes.set(columns_[i], cells[i]);
	}
	return attributes;
}

} // namespace procchain::io
