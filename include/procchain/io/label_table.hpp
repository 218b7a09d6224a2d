#pragma once

#include "procchain/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procchain::io {

enum class FilterType {
	/// Label equals the filter value.
	Exact,
	/// Label contains the filter value.
	Contains,
	/// Label equals any of the filter values.
	List
};

std::string_view filterTypeName(FilterType type);
std::optional<FilterType> parseFilterType(std::string_view name);

struct LabelFilter {
	FilterType type = FilterType::Exact;
	std::vector<std::string> values;

	bool matches(std::string_view label) const;
};

/**
 * @class ILabelLookup
 * @brief Class labels of workpieces, by class column.
 */
class ILabelLookup {
public:
	virtual ~ILabelLookup() = default;

	/// @throws core::ConfigError for an unknown class column.
	virtual std::optional<std::string> lookup(core::WorkpieceId workpiece_id, const std::string &class_column) const = 0;

	/**
	 * @brief Workpieces whose label matches the filter, in table order.
	 * @throws core::ConfigError for an unknown class column.
	 */
	virtual std::vector<core::WorkpieceId> query(const std::string &class_column, const LabelFilter &filter) const = 0;
};

/**
 * @class ClassValueTable
 * @brief The class_values.csv label table.
 *
 * Rows whose upper_workpiece_id is "workpiece_not_used" are dropped on load.
 */
class ClassValueTable final : public ILabelLookup {
public:
	struct Row {
		core::WorkpieceId workpiece_id = 0;
		/// Label per class column, aligned with columns().
		std::vector<std::string> labels;
	};

	ClassValueTable(std::vector<std::string> class_columns, std::vector<Row> rows);

	/**
	 * @brief Reads a comma separated table with a leading index column.
	 * @throws core::NotFoundError if the file is missing, core::ParseError if malformed.
	 */
	static ClassValueTable fromCsv(const std::string &path);

	std::optional<std::string> lookup(core::WorkpieceId workpiece_id, const std::string &class_column) const override;
	std::vector<core::WorkpieceId> query(const std::string &class_column, const LabelFilter &filter) const override;

	const std::vector<std::string> &columns() const noexcept {
		return class_columns_;
	}
	std::size_t size() const noexcept {
		return rows_.size();
	}

	static constexpr const char *kWorkpieceIdColumn = "upper_workpiece_id";
	static constexpr const char *kUnusedMarker = "workpiece_not_used";

private:
	std::size_t columnIndex(const std::string &class_column) const;

	std::vector<std::string> class_columns_;
	std::vector<Row> rows_;
};

} // namespace procchain::io
