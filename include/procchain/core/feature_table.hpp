#pragma once

#include "procchain/core/types.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace procchain::core {

/// One cell of a feature table: empty, a number, a text attribute or a whole series.
using FeatureValue = std::variant<std::monostate, double, std::string, Series>;

FeatureValue toFeatureValue(const StaticValue &value);

/// Renders a cell for delimited output (series as "[v0|v1|...]").
std::string formatFeatureValue(const FeatureValue &value);

/**
 * @class FeatureRow
 * @brief Ordered column -> value mapping for one experiment.
 *
 * Column order is insertion order. Inserting an existing column throws
 * std::logic_error, since kind prefixes keep the namespaces of different
 * recordings disjoint.
 */
class FeatureRow {
public:
	void set(std::string column, FeatureValue value);

	/// Appends all columns of another row, keeping their order.
	void append(FeatureRow other);

	bool has(std::string_view column) const;
	const FeatureValue *find(std::string_view column) const;
	const FeatureValue &at(std::string_view column) const;

	/// Numeric cell value; throws std::out_of_range if missing and std::bad_variant_access if not numeric.
	double number(std::string_view column) const;

	const std::vector<std::string> &columns() const noexcept {
		return columns_;
	}
	const std::vector<FeatureValue> &values() const noexcept {
		return values_;
	}
	std::size_t size() const noexcept {
		return columns_.size();
	}
	bool empty() const noexcept {
		return columns_.empty();
	}

	/// Columns starting with the given prefix.
	std::vector<std::string> columnsWithPrefix(std::string_view prefix) const;

private:
	std::vector<std::string> columns_;
	std::vector<FeatureValue> values_;
	std::unordered_map<std::string, std::size_t> index_;
};

/**
 * @class FeatureTable
 * @brief Rows of features with the union of their columns in first-seen order.
 */
class FeatureTable {
public:
	FeatureTable() = default;
	explicit FeatureTable(std::vector<FeatureRow> rows);

	/**
	 * @brief Table with a fixed column order.
	 *
	 * Rows may leave columns out. Throws std::logic_error on a repeated column
	 * or on a row column outside of `columns`.
	 */
	FeatureTable(std::vector<std::string> columns, std::vector<FeatureRow> rows);

	void addRow(FeatureRow row);

	const std::vector<FeatureRow> &rows() const noexcept {
		return rows_;
	}
	const std::vector<std::string> &columns() const noexcept {
		return columns_;
	}
	std::size_t rowCount() const noexcept {
		return rows_.size();
	}
	std::size_t columnCount() const noexcept {
		return columns_.size();
	}
	bool hasColumn(std::string_view column) const;

	/// Cell at (row, column); an empty value when the row lacks the column.
	const FeatureValue &cell(std::size_t row, std::string_view column) const;

	/**
	 * @brief Widens every series-valued column c into c_0 .. c_{n-1}.
	 *
	 * n is the longest series found in that column; shorter series leave
	 * trailing cells empty.
	 */
	FeatureTable exploded() const;

	void writeCsv(std::ostream &out, char delimiter = ',') const;
	void writeCsv(const std::string &path, char delimiter = ',') const;

private:
	void registerColumns(const FeatureRow &row);

	std::vector<FeatureRow> rows_;
	std::vector<std::string> columns_;
	std::unordered_map<std::string, std::size_t> column_index_;
};

} // namespace procchain::core
