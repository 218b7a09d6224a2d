#include "procchain/config/settings_loader.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/core/experiment.hpp"
#include "procchain/io/file_data_source.hpp"
#include "procchain/utils/logging.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace procchain;

namespace {

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

} // namespace

int main(int argc, char **argv) {
	if (argc < 3) {
		std::cerr << "usage: " << argv[0] << " <data-root> <workpiece-id> [settings-dir]\n";
		return 2;
	}
	utils::Logging::init(utils::Logging::parseLevel("debug"));

	try {
		auto source = std::make_shared<io::FileDataSource>(argv[1]);
		const core::WorkpieceId id = std::stoll(argv[2]);

		printHeader("Experiment");
		core::Experiment experiment(id, source);
		std::cout << experiment.describe() << "\n";

		for (auto kind : experiment.getAvailableProcesses()) {
			const auto *recording = experiment.recording(kind);
			printHeader(std::string(core::processKindName(kind)));
			for (const auto &name : recording->serialData().names()) {
				std::cout << "  " << name << ": " << recording->serialData().at(name).size() << " samples\n";
			}
			for (const auto &name : recording->staticData().names()) {
				std::cout << "  " << name << " = " << core::toText(recording->staticData().at(name)) << "\n";
			}
		}

		if (argc > 3) {
			printHeader("Features");
			auto row = experiment.getData(config::loadSettings(argv[3]));
			for (std::size_t i = 0; i < row.size(); ++i) {
				std::cout << "  " << row.columns()[i] << " = " << core::formatFeatureValue(row.values()[i]) << "\n";
			}
		}
	} catch (const std::exception &e) {
		std::cerr << "error: " << e.what() << "\n";
		return 1;
	}
	return 0;
}
