#pragma once

#include "procchain/core/types.hpp"

#include <string>
#include <vector>

namespace procchain::core {

/// Native encoding of a recording's serial data.
enum class SourceFormat {
	/// Comma separated table with a leading index column and a header row.
	CsvTable,
	/// Semicolon separated rows after a "-start data-" marker, fixed column order.
	MarkedText,
	/// JSON document with a "tightening steps" array.
	JsonSteps
};

/**
 * @struct RecordingSchema
 * @brief Fixed per-kind description of where a recording lives and what it contains.
 */
struct RecordingSchema {
	ProcessKind kind;
	SourceFormat format;
	/// Directory below the corpus root, e.g. "injection_molding/upper_workpiece".
	std::string directory;
	/// Value of the static table's workpiece_location column; empty when the table has one row per id.
	std::string location;
	/// The static table starts with an unnamed index column.
	bool static_index_column = false;
	/// Name of the time axis in the source.
	std::string time_series;
	/// Source column order for formats without a header (MarkedText); includes the time axis.
	std::vector<std::string> source_columns;
	/// Measurement series every recording of this kind is expected to carry.
	std::vector<std::string> series;
};

const RecordingSchema &schemaFor(ProcessKind kind);

} // namespace procchain::core
