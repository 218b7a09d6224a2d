#include "procchain/core/experiment.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/core/recording_loader.hpp"
#include "procchain/utils/logging.hpp"

#include <algorithm>
#include <sstream>

namespace procchain::core {

std::size_t Experiment::slot(ProcessKind kind) {
	return static_cast<std::size_t>(kind);
}

Experiment::Experiment(WorkpieceId workpiece_id, std::shared_ptr<const io::IDataSource> source)
    : workpiece_id_(workpiece_id) {
	for (auto kind : kAllProcessKinds) {
		RecordingLoader loader(kind, source);
		try {
			recordings_[slot(kind)].emplace(loader.load(workpiece_id));
		} catch (const NotFoundError &e) {
			PROCCHAIN_DEBUG("Workpiece {}: {} not available: {}", workpiece_id, processKindName(kind), e.what());
		}
	}
}

FeatureRow Experiment::getData(const config::ExtractionConfig &config,
                               const std::optional<std::vector<ProcessKind>> &kinds,
                               const features::FeatureLibrary &library) const {
	FeatureRow row;
	for (auto kind : kAllProcessKinds) {
		if (kinds && std::find(kinds->begin(), kinds->end(), kind) == kinds->end()) {
			continue;
		}
		const auto &recording = recordings_[slot(kind)];
		if (recording) {
			row.append(recording->getData(config, library));
		}
	}
	return row;
}

std::set<ProcessKind> Experiment::getAvailableProcesses() const {
	std::set<ProcessKind> kinds;
	for (auto kind : kAllProcessKinds) {
		if (recordings_[slot(kind)]) {
			kinds.insert(kind);
		}
	}
	return kinds;
}

bool Experiment::hasProcess(ProcessKind kind) const {
	return recordings_[slot(kind)].has_value();
}

bool Experiment::isComplete() const {
	for (const auto &recording : recordings_) {
		if (!recording) {
			return false;
		}
	}
	return true;
}

const Recording *Experiment::recording(ProcessKind kind) const {
	const auto &recording = recordings_[slot(kind)];
	return recording ? &*recording : nullptr;
}

std::string Experiment::describe() const {
	std::ostringstream oss;
	oss << "Experiment " << workpiece_id_ << " (" << getAvailableProcesses().size() << "/4 processes)";
	for (auto kind : kAllProcessKinds) {
		oss << "\n  " << processKindName(kind) << ": ";
		const auto *rec = recording(kind);
		if (!rec) {
			oss << "missing";
			continue;
		}
		const auto &serial = rec->serialData();
		oss << serial.size() << " series, " << serial.timeAxis().size() << " samples, "
		    << rec->staticData().size() << " static attributes";
		if (!serial.steps().empty()) {
			oss << ", " << serial.steps().size() << " steps";
		}
	}
	return oss.str();
}

} // namespace procchain::core
