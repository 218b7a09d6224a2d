#include "procchain/core/feature_table.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/text.hpp"

#include <algorithm>
#include <fstream>
#include <ostream>
#include <stdexcept>

namespace procchain::core {

FeatureValue toFeatureValue(const StaticValue &value) {
	struct Visitor {
		FeatureValue operator()(std::monostate) const {
			return std::monostate {};
		}
		FeatureValue operator()(int64_t v) const {
			return static_cast<double>(v);
		}
		FeatureValue operator()(double v) const {
			return v;
		}
		FeatureValue operator()(const std::string &v) const {
			return v;
		}
	};
	return std::visit(Visitor {}, value);
}

std::string formatFeatureValue(const FeatureValue &value) {
	struct Visitor {
		std::string operator()(std::monostate) const {
			return "";
		}
		std::string operator()(double v) const {
			return utils::formatNumber(v);
		}
		std::string operator()(const std::string &v) const {
			return v;
		}
		std::string operator()(const Series &series) const {
			std::string text = "[";
			for (size_t i = 0; i < series.size(); ++i) {
				if (i > 0) {
					text.push_back('|');
				}
				text += utils::formatNumber(series[i]);
			}
			text.push_back(']');
			return text;
		}
	};
	return std::visit(Visitor {}, value);
}

// ============================================================================
// FeatureRow
// ============================================================================

void FeatureRow::set(std::string column, FeatureValue value) {
	if (index_.count(column) > 0) {
		throw std::logic_error("Feature column '" + column + "' is already set.");
	}
	index_.emplace(column, columns_.size());
	columns_.push_back(std::move(column));
	values_.push_back(std::move(value));
}

void FeatureRow::append(FeatureRow other) {
	for (size_t i = 0; i < other.columns_.size(); ++i) {
		set(std::move(other.columns_[i]), std::move(other.values_[i]));
	}
}

bool FeatureRow::has(std::string_view column) const {
	return index_.find(std::string(column)) != index_.end();
}

const FeatureValue *FeatureRow::find(std::string_view column) const {
	auto it = index_.find(std::string(column));
	return it == index_.end() ? nullptr : &values_[it->second];
}

const FeatureValue &FeatureRow::at(std::string_view column) const {
	const auto *value = find(column);
	if (!value) {
		throw std::out_of_range("Feature column '" + std::string(column) + "' does not exist.");
	}
	return *value;
}

double FeatureRow::number(std::string_view column) const {
	return std::get<double>(at(column));
}

std::vector<std::string> FeatureRow::columnsWithPrefix(std::string_view prefix) const {
	std::vector<std::string> result;
	for (const auto &column : columns_) {
		if (column.compare(0, prefix.size(), prefix) == 0) {
			result.push_back(column);
		}
	}
	return result;
}

// ============================================================================
// FeatureTable
// ============================================================================

FeatureTable::FeatureTable(std::vector<FeatureRow> rows) {
	for (auto &row : rows) {
		addRow(std::move(row));
	}
}

FeatureTable::FeatureTable(std::vector<std::string> columns, std::vector<FeatureRow> rows) {
	for (auto &column : columns) {
		if (!column_index_.emplace(column, columns_.size()).second) {
			throw std::logic_error("Feature column '" + column + "' is listed twice.");
		}
		columns_.push_back(std::move(column));
	}
	for (const auto &row : rows) {
		for (const auto &column : row.columns()) {
			if (column_index_.count(column) == 0) {
				throw std::logic_error("Feature column '" + column + "' is not part of the table.");
			}
		}
	}
	rows_ = std::move(rows);
}

void FeatureTable::registerColumns(const FeatureRow &row) {
	for (const auto &column : row.columns()) {
		if (column_index_.count(column) == 0) {
			column_index_.emplace(column, columns_.size());
			columns_.push_back(column);
		}
	}
}

void FeatureTable::addRow(FeatureRow row) {
	registerColumns(row);
	rows_.push_back(std::move(row));
}

bool FeatureTable::hasColumn(std::string_view column) const {
	return column_index_.find(std::string(column)) != column_index_.end();
}

const FeatureValue &FeatureTable::cell(std::size_t row, std::string_view column) const {
	static const FeatureValue empty {};
	const auto *value = rows_.at(row).find(column);
	return value ? *value : empty;
}

FeatureTable FeatureTable::exploded() const {
	std::unordered_map<std::string, size_t> widths;
	for (const auto &row : rows_) {
		for (size_t i = 0; i < row.size(); ++i) {
			if (const auto *series = std::get_if<Series>(&row.values()[i])) {
				auto &width = widths[row.columns()[i]];
				width = std::max(width, series->size());
			}
		}
	}

	std::vector<std::string> wide_columns;
	for (const auto &column : columns_) {
		auto width_it = widths.find(column);
		if (width_it == widths.end()) {
			wide_columns.push_back(column);
			continue;
		}
		for (size_t i = 0; i < width_it->second; ++i) {
			wide_columns.push_back(column + "_" + std::to_string(i));
		}
	}

	std::vector<FeatureRow> wide_rows;
	wide_rows.reserve(rows_.size());
	for (const auto &row : rows_) {
		FeatureRow wide;
		for (const auto &column : columns_) {
			const auto *value = row.find(column);
			auto width_it = widths.find(column);
			if (width_it == widths.end()) {
				wide.set(column, value ? *value : FeatureValue {});
				continue;
			}
			const auto *series = value ? std::get_if<Series>(value) : nullptr;
			for (size_t i = 0; i < width_it->second; ++i) {
				auto name = column + "_" + std::to_string(i);
				if (series && i < series->size()) {
					wide.set(std::move(name), (*series)[i]);
				} else {
					wide.set(std::move(name), FeatureValue {});
				}
			}
		}
		wide_rows.push_back(std::move(wide));
	}
	return FeatureTable(std::move(wide_columns), std::move(wide_rows));
}

void FeatureTable::writeCsv(std::ostream &out, char delimiter) const {
	for (size_t i = 0; i < columns_.size(); ++i) {
		if (i > 0) {
			out << delimiter;
		}
		out << utils::quoteField(columns_[i], delimiter);
	}
	out << '\n';
	for (const auto &row : rows_) {
		for (size_t i = 0; i < columns_.size(); ++i) {
			if (i > 0) {
				out << delimiter;
			}
			if (const auto *value = row.find(columns_[i])) {
				out << utils::quoteField(formatFeatureValue(*value), delimiter);
			}
		}
		out << '\n';
	}
}

void FeatureTable::writeCsv(const std::string &path, char delimiter) const {
	std::ofstream out(path);
	if (!out) {
		throw Error("Cannot open '" + path + "' for writing.");
	}
	writeCsv(out, delimiter);
	if (!out) {
		throw Error("Failed while writing '" + path + "'.");
	}
}

} // namespace procchain::core
