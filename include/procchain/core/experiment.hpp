#pragma once

#include "procchain/core/recording.hpp"
#include "procchain/io/data_source.hpp"

#include <array>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace procchain::core {

/**
 * @class Experiment
 * @brief The recordings of all four process streams of one workpiece.
 *
 * Construction loads every kind once. A kind whose source is missing is
 * recorded as absent; any other load failure aborts construction.
 */
class Experiment {
public:
	Experiment(WorkpieceId workpiece_id, std::shared_ptr<const io::IDataSource> source);

	WorkpieceId workpieceId() const noexcept {
		return workpiece_id_;
	}

	/**
	 * @brief Union of the rows of all present recordings, in kind order.
	 * @param kinds Restricts the union to these kinds when set.
	 */
	FeatureRow getData(const config::ExtractionConfig &config,
	                   const std::optional<std::vector<ProcessKind>> &kinds = std::nullopt,
	                   const features::FeatureLibrary &library = features::FeatureLibrary::Default()) const;

	std::set<ProcessKind> getAvailableProcesses() const;
	bool hasProcess(ProcessKind kind) const;
	bool isComplete() const;

	/// The recording of one kind, or nullptr when it is absent.
	const Recording *recording(ProcessKind kind) const;

	/// One-line-per-kind summary of the loaded recordings.
	std::string describe() const;

private:
	static std::size_t slot(ProcessKind kind);

	WorkpieceId workpiece_id_;
	std::array<std::optional<Recording>, 4> recordings_;
};

} // namespace procchain::core
