#pragma once

#include "procchain/core/record_data.hpp"
#include "procchain/core/schema.hpp"
#include "procchain/core/types.hpp"

#include <iosfwd>
#include <string>

namespace procchain::io {

/**
 * @struct SourceLocation
 * @brief Where the data of one recording lives, as resolved from its static row.
 */
struct SourceLocation {
	core::WorkpieceId workpiece_id = 0;
	core::ProcessKind kind = core::ProcessKind::UpperInjection;
	/// Path of the serial data file.
	std::string serial_path;
	/// The recording's row of the static table.
	core::StaticAttributes static_row;
};

/**
 * @class IDataSource
 * @brief Resolves and parses recordings for the recording loader.
 */
class IDataSource {
public:
	virtual ~IDataSource() = default;

	/**
	 * @brief Finds the source of one recording.
	 * @throws core::NotFoundError when the kind has no source for this id.
	 * @throws core::ParseError when the static table exists but is malformed.
	 */
	virtual SourceLocation resolvePath(core::WorkpieceId workpiece_id, core::ProcessKind kind) const = 0;

	/**
	 * @brief Reads the static attributes and serial series of a resolved recording.
	 * @throws core::NotFoundError when the serial file is missing.
	 * @throws core::ParseError when it is malformed.
	 */
	virtual core::RawRecording parse(const SourceLocation &location) const = 0;
};

/**
 * @class IRecordParser
 * @brief Parses the serial data of one source format.
 */
class IRecordParser {
public:
	virtual ~IRecordParser() = default;

	/**
	 * @brief Reads one serial data stream.
	 *
	 * Static attributes derived from the serial data (e.g. the step count of
	 * a screw run) are returned in static_data.
	 *
	 * @throws core::ParseError on malformed input.
	 */
	virtual core::RawRecording parse(std::istream &input, const core::RecordingSchema &schema) const = 0;
};

} // namespace procchain::io
