#pragma once

#include "procchain/core/record_data.hpp"
#include "procchain/core/types.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace procchain::io {

/// Types a delimited-text cell: integer, then floating point, then text; blank is empty.
core::StaticValue parseCell(std::string_view text);

/**
 * @class StaticTable
 * @brief A delimited table of static attributes with typed cells.
 */
class StaticTable {
public:
	StaticTable() = default;
	StaticTable(std::vector<std::string> columns, std::vector<std::vector<core::StaticValue>> rows);

	/**
	 * @brief Reads a table with a header row.
	 * @param index_column Drop the first column (an unnamed row index).
	 * @throws core::ParseError on a row whose field count differs from the header.
	 */
	static StaticTable read(std::istream &input, char delimiter, bool index_column, const std::string &origin);

	/// Reads a file; throws core::NotFoundError when it cannot be opened.
	static StaticTable readFile(const std::string &path, char delimiter, bool index_column);

	const std::vector<std::string> &columns() const noexcept {
		return columns_;
	}
	std::size_t rowCount() const noexcept {
		return rows_.size();
	}
	std::optional<std::size_t> columnIndex(std::string_view column) const;

	const core::StaticValue &value(std::size_t row, std::size_t column) const;

	/**
	 * @brief First row whose upper_workpiece_id equals the id (as number or text)
	 *        and, when location is non-empty, whose workpiece_location matches.
	 */
	std::optional<std::size_t> findWorkpiece(core::WorkpieceId workpiece_id, std::string_view location) const;

	core::StaticAttributes rowAttributes(std::size_t row) const;

private:
	std::vector<std::string> columns_;
	std::vector<std::vector<core::StaticValue>> rows_;
};

} // namespace procchain::io
