#pragma once

#include "procchain/io/data_source.hpp"

namespace procchain::io {

/**
 * @class CsvTableParser
 * @brief Comma separated table with a header row and a leading index column.
 *
 * Every named column becomes a series; the schema's time column becomes the
 * time axis. Blank cells are read as NaN.
 */
class CsvTableParser final : public IRecordParser {
public:
	explicit CsvTableParser(char delimiter = ',');

	core::RawRecording parse(std::istream &input, const core::RecordingSchema &schema) const override;

private:
	char delimiter_;
};

/**
 * @class MarkedTextParser
 * @brief Free-form header followed by delimited rows after a "-start data-" line.
 *
 * Rows carry no header; columns follow RecordingSchema::source_columns. A
 * decimal comma is accepted when the delimiter is not a comma.
 */
class MarkedTextParser final : public IRecordParser {
public:
	explicit MarkedTextParser(char delimiter = ';');

	core::RawRecording parse(std::istream &input, const core::RecordingSchema &schema) const override;

	static constexpr const char *kDataMarker = "-start data-";

private:
	char delimiter_;
};

} // namespace procchain::io
