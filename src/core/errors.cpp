#include "procchain/core/errors.hpp"

#include <sstream>

namespace procchain::core {

DuplicateIdError::DuplicateIdError(int64_t workpiece_id)
    : Error("Duplicate workpiece id " + std::to_string(workpiece_id) + " in dataset request."),
      workpiece_id_(workpiece_id) {
}

BuildError::BuildError(std::vector<Failure> failures)
    : Error(summarize(failures)), failures_(std::move(failures)) {
}

std::string BuildError::summarize(const std::vector<Failure> &failures) {
	std::ostringstream oss;
	oss << "Failed to build " << failures.size() << " experiment" << (failures.size() == 1 ? "" : "s");
	for (const auto &failure : failures) {
		oss << "\n  " << failure.workpiece_id << ": " << failure.message;
	}
	return oss.str();
}

} // namespace procchain::core
