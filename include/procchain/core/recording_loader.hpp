#pragma once

#include "procchain/core/recording.hpp"
#include "procchain/io/data_source.hpp"

#include <memory>

namespace procchain::core {

/**
 * @class RecordingLoader
 * @brief Loads recordings of one kind through a data source.
 */
class RecordingLoader {
public:
	RecordingLoader(ProcessKind kind, std::shared_ptr<const io::IDataSource> source);

	/**
	 * @brief Resolves and parses the recording of one workpiece.
	 *
	 * Schema series the source lacks are present but empty.
	 *
	 * @throws NotFoundError when the source has no recording for this id.
	 * @throws ParseError when the recording is malformed.
	 */
	Recording load(WorkpieceId workpiece_id) const;

	ProcessKind kind() const noexcept {
		return kind_;
	}

private:
	ProcessKind kind_;
	std::shared_ptr<const io::IDataSource> source_;
};

} // namespace procchain::core
