#pragma once

#include "procchain/core/experiment.hpp"
#include "procchain/core/feature_table.hpp"
#include "procchain/io/data_source.hpp"
#include "procchain/io/label_table.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace procchain::core {

/// Collaborators a dataset is built from.
struct DataContext {
	std::shared_ptr<const io::IDataSource> source;
	std::shared_ptr<const io::ILabelLookup> labels;
};

/// Label-based selection of workpieces.
struct ClassQuery {
	std::string class_column;
	io::LabelFilter filter;
	std::optional<std::size_t> sample_size;
	uint64_t seed = 42;
};

struct ExtractionOptions {
	/// Skip experiments that lack any of the four processes.
	bool complete_only = false;
	/// Widen raw series columns into one column per sample.
	bool explode = false;
};

struct DataQualityReport {
	struct KindSummary {
		std::size_t missing = 0;
		double missing_percentage = 0.0;
		std::vector<WorkpieceId> missing_ids;
	};

	std::size_t total = 0;
	std::size_t complete = 0;
	std::map<ProcessKind, KindSummary> per_kind;

	std::string toString() const;
};

/**
 * @class Dataset
 * @brief Ordered experiments plus the label column they are classified by.
 */
class Dataset {
public:
	/// Default class column for datasets built from ids.
	static constexpr const char *kDefaultClassColumn = "class_value_upper_work_piece";

	/**
	 * @brief Builds one experiment per id, in order.
	 *
	 * @throws DuplicateIdError when an id repeats, before anything is loaded.
	 * @throws BuildError listing every id whose experiment failed to load.
	 */
	static Dataset fromIds(const std::vector<WorkpieceId> &ids, const DataContext &context,
	                       std::string class_column = kDefaultClassColumn);

	/**
	 * @brief Builds the experiments of all workpieces whose label matches the query.
	 *
	 * With a sample size below the match count, a seeded random subset is
	 * kept in table order.
	 *
	 * @throws ConfigError for an unknown class column or an empty filter.
	 */
	static Dataset fromClassValues(const ClassQuery &query, const DataContext &context);

	const std::vector<Experiment> &experiments() const noexcept {
		return experiments_;
	}
	std::size_t size() const noexcept {
		return experiments_.size();
	}
	bool empty() const noexcept {
		return experiments_.empty();
	}
	const std::string &classColumn() const noexcept {
		return class_column_;
	}
	std::vector<WorkpieceId> workpieceIds() const;

	/// One label per experiment under classColumn(); empty without a label lookup.
	std::vector<std::optional<std::string>> getClassLabels() const;

	/// Columns workpiece_id, available_processes and label.
	FeatureTable getExperimentInfo() const;

	std::map<std::string, std::size_t> classDistribution() const;

	DataQualityReport dataQualityReport() const;

	/**
	 * @brief One row per experiment: workpiece_id, the features, then the label column.
	 *
	 * Feature columns are grouped by configuration entry, entries in kind
	 * order and then configuration order, so the column order does not depend
	 * on which recordings the experiments happen to have.
	 *
	 * @throws ConfigError when the configuration is invalid or would produce a
	 *         column named like workpiece_id or the label column, before any
	 *         experiment is processed.
	 */
	FeatureTable getData(const config::ExtractionConfig &config, const ExtractionOptions &options = {},
	                     const features::FeatureLibrary &library = features::FeatureLibrary::Default()) const;

private:
	Dataset(std::vector<Experiment> experiments, std::shared_ptr<const io::ILabelLookup> labels,
	        std::string class_column);

	std::vector<Experiment> experiments_;
	std::shared_ptr<const io::ILabelLookup> labels_;
	std::string class_column_;
};

/// Seeded sample of `count` elements keeping their relative order.
std::vector<WorkpieceId> sampleOrdered(const std::vector<WorkpieceId> &ids, std::size_t count, uint64_t seed);

} // namespace procchain::core
