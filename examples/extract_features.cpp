#include "procchain/config/settings_loader.hpp"
#include "procchain/core/dataset.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/io/file_data_source.hpp"
#include "procchain/io/label_table.hpp"
#include "procchain/utils/logging.hpp"
#include "procchain/utils/text.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace procchain;

namespace {

struct Options {
	std::string data_root;
	std::string settings_dir;
	std::string class_column = core::Dataset::kDefaultClassColumn;
	std::string filter_type = "exact";
	std::vector<std::string> filter_values;
	std::optional<std::size_t> sample_size;
	uint64_t seed = 42;
	std::vector<core::WorkpieceId> ids;
	core::ExtractionOptions extraction;
	std::string output;
	std::string log_level = "info";
	bool report = false;
};

void printUsage(const char *program) {
	std::cerr << "usage: " << program << " --data <root> --settings <dir>\n"
	          << "         [--class-column C --filter-type exact|contains|list --filter-value V ...]\n"
	          << "         [--sample-size N] [--seed S] [--ids 1,2,3]\n"
	          << "         [--complete-only] [--explode] [--report] [--output file.csv] [--log-level L]\n";
}

std::vector<core::WorkpieceId> parseIds(const std::string &text) {
	std::vector<core::WorkpieceId> ids;
	for (const auto &field : utils::splitRecord(text, ',')) {
		auto id = utils::parseInteger(utils::trim(field));
		if (!id) {
			throw std::invalid_argument("invalid workpiece id '" + field + "'");
		}
		ids.push_back(*id);
	}
	return ids;
}

std::size_t parseCount(const std::string &text, const char *option) {
	auto value = utils::parseInteger(text);
	if (!value || *value < 0) {
		throw std::invalid_argument(std::string(option) + " expects a non-negative integer, got '" + text + "'");
	}
	return static_cast<std::size_t>(*value);
}

Options parseArguments(int argc, char **argv) {
	Options options;
	for (int i = 1; i < argc; ++i) {
		const char *arg = argv[i];
		auto next = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument(std::string(arg) + " needs a value");
			}
			return argv[++i];
		};

		if (std::strcmp(arg, "--data") == 0) {
			options.data_root = next();
		} else if (std::strcmp(arg, "--settings") == 0) {
			options.settings_dir = next();
		} else if (std::strcmp(arg, "--class-column") == 0) {
			options.class_column = next();
		} else if (std::strcmp(arg, "--filter-type") == 0) {
			options.filter_type = next();
		} else if (std::strcmp(arg, "--filter-value") == 0) {
			options.filter_values.push_back(next());
		} else if (std::strcmp(arg, "--sample-size") == 0) {
			options.sample_size = parseCount(next(), arg);
		} else if (std::strcmp(arg, "--seed") == 0) {
			options.seed = parseCount(next(), arg);
		} else if (std::strcmp(arg, "--ids") == 0) {
			options.ids = parseIds(next());
		} else if (std::strcmp(arg, "--complete-only") == 0) {
			options.extraction.complete_only = true;
		} else if (std::strcmp(arg, "--explode") == 0) {
			options.extraction.explode = true;
		} else if (std::strcmp(arg, "--report") == 0) {
			options.report = true;
		} else if (std::strcmp(arg, "--output") == 0) {
			options.output = next();
		} else if (std::strcmp(arg, "--log-level") == 0) {
			options.log_level = next();
		} else {
			throw std::invalid_argument(std::string("unrecognized option ") + arg);
		}
	}
	if (options.data_root.empty() || options.settings_dir.empty()) {
		throw std::invalid_argument("--data and --settings are required");
	}
	if (options.ids.empty() == options.filter_values.empty()) {
		throw std::invalid_argument("give either --ids or at least one --filter-value");
	}
	return options;
}

core::Dataset buildDataset(const Options &options, const core::DataContext &context) {
	if (!options.ids.empty()) {
		return core::Dataset::fromIds(options.ids, context, options.class_column);
	}
	auto type = io::parseFilterType(options.filter_type);
	if (!type) {
		throw core::ConfigError("Unknown filter type '" + options.filter_type + "'.");
	}
	core::ClassQuery query;
	query.class_column = options.class_column;
	query.filter = {*type, options.filter_values};
	query.sample_size = options.sample_size;
	query.seed = options.seed;
	return core::Dataset::fromClassValues(query, context);
}

} // namespace

int main(int argc, char **argv) {
	Options options;
	try {
		options = parseArguments(argc, argv);
		utils::Logging::init(utils::Logging::parseLevel(options.log_level));
	} catch (const std::invalid_argument &e) {
		std::cerr << "error: " << e.what() << "\n";
		printUsage(argv[0]);
		return 2;
	}

	try {
		auto config = config::loadSettings(options.settings_dir);

		core::DataContext context;
		context.source = std::make_shared<io::FileDataSource>(options.data_root);
		const auto labels_path = std::filesystem::path(options.data_root) / "class_values.csv";
		if (std::filesystem::exists(labels_path)) {
			context.labels = std::make_shared<io::ClassValueTable>(io::ClassValueTable::fromCsv(labels_path.string()));
		} else {
			PROCCHAIN_WARN("No label table at {}; label column will be empty", labels_path.string());
		}

		auto dataset = buildDataset(options, context);
		if (options.report) {
			std::cerr << dataset.dataQualityReport().toString() << "\n";
		}

		auto table = dataset.getData(config, options.extraction);
		if (options.output.empty()) {
			table.writeCsv(std::cout);
		} else {
			table.writeCsv(options.output);
			PROCCHAIN_INFO("Wrote {} rows to {}", table.rowCount(), options.output);
		}
	} catch (const core::BuildError &e) {
		for (const auto &failure : e.failures()) {
			std::cerr << "workpiece " << failure.workpiece_id << ": " << failure.message << "\n";
		}
		return 1;
	} catch (const core::Error &e) {
		PROCCHAIN_CRITICAL("{}", e.what());
		return 1;
	} catch (const std::exception &e) {
		PROCCHAIN_CRITICAL("Extraction failed: {}", e.what());
		return 1;
	}
	return 0;
}
