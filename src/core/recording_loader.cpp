#include "procchain/core/recording_loader.hpp"
#include "procchain/core/schema.hpp"
#include "procchain/utils/logging.hpp"

#include <stdexcept>

namespace procchain::core {

RecordingLoader::RecordingLoader(ProcessKind kind, std::shared_ptr<const io::IDataSource> source)
    : kind_(kind), source_(std::move(source)) {
	if (!source_) {
		throw std::invalid_argument("RecordingLoader requires a data source.");
	}
}

Recording RecordingLoader::load(WorkpieceId workpiece_id) const {
	auto location = source_->resolvePath(workpiece_id, kind_);
	auto raw = source_->parse(location);

	for (const auto &name : schemaFor(kind_).series) {
		if (!raw.serial_data.has(name)) {
			raw.serial_data.set(name, {});
		}
	}

	PROCCHAIN_DEBUG("Loaded {} recording of workpiece {} ({} series, {} samples on the time axis)",
	                processKindName(kind_), workpiece_id, raw.serial_data.size(), raw.serial_data.timeAxis().size());
	return Recording(workpiece_id, kind_, std::move(raw.static_data), std::move(raw.serial_data));
}

} // namespace procchain::core
