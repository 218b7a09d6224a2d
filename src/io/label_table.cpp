#include "procchain/io/label_table.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/logging.hpp"
#include "procchain/utils/text.hpp"

#include <fstream>
#include <stdexcept>

namespace procchain::io {

std::string_view filterTypeName(FilterType type) {
	switch (type) {
	case FilterType::Exact:
		return "exact";
	case FilterType::Contains:
		return "contains";
	case FilterType::List:
		return "list";
	}
	return "exact";
}

std::optional<FilterType> parseFilterType(std::string_view name) {
	for (auto type : {FilterType::Exact, FilterType::Contains, FilterType::List}) {
		if (filterTypeName(type) == name) {
			return type;
		}
	}
	return std::nullopt;
}

bool LabelFilter::matches(std::string_view label) const {
	switch (type) {
	case FilterType::Exact:
		return !values.empty() && label == values.front();
	case FilterType::Contains:
		return !values.empty() && utils::contains(label, values.front());
	case FilterType::List:
		for (const auto &value : values) {
			if (label == value) {
				return true;
			}
		}
		return false;
	}
	return false;
}

ClassValueTable::ClassValueTable(std::vector<std::string> class_columns, std::vector<Row> rows)
    : class_columns_(std::move(class_columns)), rows_(std::move(rows)) {
	for (const auto &row : rows_) {
		if (row.labels.size() != class_columns_.size()) {
			throw std::invalid_argument("ClassValueTable row width does not match the column count.");
		}
	}
}

ClassValueTable ClassValueTable::fromCsv(const std::string &path) {
	std::ifstream input(path);
	if (!input) {
		throw core::NotFoundError("Label table '" + path + "' not found.");
	}

	std::string line;
	std::size_t line_number = 0;
	std::vector<std::string> header;
	while (std::getline(input, line)) {
		++line_number;
		if (!utils::trim(line).empty()) {
			header = utils::splitRecord(line, ',');
			break;
		}
	}

	// Column 0 is the row index.
	std::optional<std::size_t> id_column;
	std::vector<std::size_t> label_fields;
	std::vector<std::string> class_columns;
	for (std::size_t i = 1; i < header.size(); ++i) {
		auto name = std::string(utils::trim(header[i]));
		if (name == kWorkpieceIdColumn) {
			id_column = i;
		} else {
			label_fields.push_back(i);
			class_columns.push_back(std::move(name));
		}
	}
	if (!id_column) {
		throw core::ParseError(path + ": no '" + kWorkpieceIdColumn + "' column.");
	}

	std::vector<Row> rows;
	std::size_t unused = 0;
	while (std::getline(input, line)) {
		++line_number;
		if (utils::trim(line).empty()) {
			continue;
		}
		auto fields = utils::splitRecord(line, ',');
		if (fields.size() != header.size()) {
			throw core::ParseError(path + ":" + std::to_string(line_number) + ": expected " +
			                       std::to_string(header.size()) + " fields, found " +
			                       std::to_string(fields.size()) + ".");
		}
		auto id_text = utils::trim(fields[*id_column]);
		if (id_text == kUnusedMarker) {
			++unused;
			continue;
		}
		auto id = utils::parseInteger(id_text);
		if (!id) {
			throw core::ParseError(path + ":" + std::to_string(line_number) + ": invalid workpiece id '" +
			                       std::string(id_text) + "'.");
		}
		Row row;
		row.workpiece_id = *id;
		for (auto field : label_fields) {
			row.labels.emplace_back(utils::trim(fields[field]));
		}
		rows.push_back(std::move(row));
	}
	if (unused > 0) {
		PROCCHAIN_DEBUG("Excluded {} unused workpiece entries from {}", unused, path);
	}
	return ClassValueTable(std::move(class_columns), std::move(rows));
}

std::size_t ClassValueTable::columnIndex(const std::string &class_column) const {
	for (std::size_t i = 0; i < class_columns_.size(); ++i) {
		if (class_columns_[i] == class_column) {
			return i;
		}
	}
	throw core::ConfigError("Class column '" + class_column + "' not found in label table. Available: " +
	                        utils::join(class_columns_, ", "));
}

std::optional<std::string> ClassValueTable::lookup(core::WorkpieceId workpiece_id,
                                                   const std::string &class_column) const {
	auto column = columnIndex(class_column);
	for (const auto &row : rows_) {
		if (row.workpiece_id == workpiece_id) {
			if (row.labels[column].empty()) {
				return std::nullopt;
			}
			return row.labels[column];
		}
	}
	return std::nullopt;
}

std::vector<core::WorkpieceId> ClassValueTable::query(const std::string &class_column,
                                                      const LabelFilter &filter) const {
	auto column = columnIndex(class_column);
	std::vector<core::WorkpieceId> ids;
	for (const auto &row : rows_) {
		if (filter.matches(row.labels[column])) {
			ids.push_back(row.workpiece_id);
		}
	}
	return ids;
}

} // namespace procchain::io
