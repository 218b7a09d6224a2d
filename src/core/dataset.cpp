#include "procchain/core/dataset.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/logging.hpp"
#include "procchain/utils/text.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace procchain::core {

namespace {

// Uniform index in [0, bound) taken from the raw engine output by rejection,
// so a seed selects the same sample with every standard library.
std::size_t drawIndex(std::mt19937_64 &rng, uint64_t bound) {
	constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
	const uint64_t limit = kMax - kMax % bound;
	uint64_t value = rng();
	while (value >= limit) {
		value = rng();
	}
	return static_cast<std::size_t>(value % bound);
}

} // namespace

std::vector<WorkpieceId> sampleOrdered(const std::vector<WorkpieceId> &ids, std::size_t count, uint64_t seed) {
	if (count >= ids.size()) {
		return ids;
	}
	std::vector<std::size_t> positions(ids.size());
	for (std::size_t i = 0; i < positions.size(); ++i) {
		positions[i] = i;
	}
	// Partial Fisher-Yates: the first `count` slots end up holding the sample.
	std::mt19937_64 rng(seed);
	for (std::size_t i = 0; i < count; ++i) {
		std::swap(positions[i], positions[i + drawIndex(rng, positions.size() - i)]);
	}
	positions.resize(count);
	std::sort(positions.begin(), positions.end());

	std::vector<WorkpieceId> sample;
	sample.reserve(count);
	for (auto position : positions) {
		sample.push_back(ids[position]);
	}
	return sample;
}

Dataset::Dataset(std::vector<Experiment> experiments, std::shared_ptr<const io::ILabelLookup> labels,
                 std::string class_column)
    : experiments_(std::move(experiments)), labels_(std::move(labels)), class_column_(std::move(class_column)) {
}

Dataset Dataset::fromIds(const std::vector<WorkpieceId> &ids, const DataContext &context, std::string class_column) {
	if (!context.source) {
		throw std::invalid_argument("Dataset requires a data source.");
	}
	std::unordered_set<WorkpieceId> seen;
	for (auto id : ids) {
		if (!seen.insert(id).second) {
			throw DuplicateIdError(id);
		}
	}

	std::vector<Experiment> experiments;
	experiments.reserve(ids.size());
	std::vector<BuildError::Failure> failures;
	for (auto id : ids) {
		try {
			experiments.emplace_back(id, context.source);
		} catch (const Error &e) {
			PROCCHAIN_ERROR("Workpiece {}: {}", id, e.what());
			failures.push_back({id, e.what()});
		}
	}
	if (!failures.empty()) {
		throw BuildError(std::move(failures));
	}

	PROCCHAIN_INFO("Built dataset of {} experiments", experiments.size());
	return Dataset(std::move(experiments), context.labels, std::move(class_column));
}

Dataset Dataset::fromClassValues(const ClassQuery &query, const DataContext &context) {
	if (!context.labels) {
		throw ConfigError("Selecting by class values requires a label table.");
	}
	if (query.filter.values.empty()) {
		throw ConfigError("Class value filter on '" + query.class_column + "' has no values.");
	}

	auto ids = context.labels->query(query.class_column, query.filter);
	PROCCHAIN_INFO("{} workpieces match {} '{}' on {}", ids.size(), io::filterTypeName(query.filter.type),
	               utils::join(query.filter.values, "|"), query.class_column);
	if (query.sample_size && *query.sample_size < ids.size()) {
		ids = sampleOrdered(ids, *query.sample_size, query.seed);
		PROCCHAIN_INFO("Sampled {} workpieces (seed {})", ids.size(), query.seed);
	}
	return fromIds(ids, context, query.class_column);
}

std::vector<WorkpieceId> Dataset::workpieceIds() const {
	std::vector<WorkpieceId> ids;
	ids.reserve(experiments_.size());
	for (const auto &experiment : experiments_) {
		ids.push_back(experiment.workpieceId());
	}
	return ids;
}

std::vector<std::optional<std::string>> Dataset::getClassLabels() const {
	std::vector<std::optional<std::string>> labels;
	labels.reserve(experiments_.size());
	for (const auto &experiment : experiments_) {
		if (labels_) {
			labels.push_back(labels_->lookup(experiment.workpieceId(), class_column_));
		} else {
			labels.emplace_back();
		}
	}
	return labels;
}

FeatureTable Dataset::getExperimentInfo() const {
	auto labels = getClassLabels();
	FeatureTable table;
	for (std::size_t i = 0; i < experiments_.size(); ++i) {
		const auto &experiment = experiments_[i];
		std::vector<std::string> kinds;
		for (auto kind : experiment.getAvailableProcesses()) {
			kinds.emplace_back(processKindName(kind));
		}
		FeatureRow row;
		row.set("workpiece_id", static_cast<double>(experiment.workpieceId()));
		row.set("available_processes", utils::join(kinds, "|"));
		row.set("label", labels[i] ? FeatureValue(*labels[i]) : FeatureValue());
		table.addRow(std::move(row));
	}
	return table;
}

std::map<std::string, std::size_t> Dataset::classDistribution() const {
	std::map<std::string, std::size_t> distribution;
	for (const auto &label : getClassLabels()) {
		if (label) {
			++distribution[*label];
		}
	}
	return distribution;
}

DataQualityReport Dataset::dataQualityReport() const {
	DataQualityReport report;
	report.total = experiments_.size();
	for (auto kind : kAllProcessKinds) {
		report.per_kind[kind];
	}
	for (const auto &experiment : experiments_) {
		if (experiment.isComplete()) {
			++report.complete;
		}
		for (auto kind : kAllProcessKinds) {
			if (!experiment.hasProcess(kind)) {
				auto &summary = report.per_kind[kind];
				++summary.missing;
				summary.missing_ids.push_back(experiment.workpieceId());
			}
		}
	}
	for (auto &entry : report.per_kind) {
		auto &summary = entry.second;
		summary.missing_percentage =
		    report.total == 0 ? 0.0 : 100.0 * static_cast<double>(summary.missing) / static_cast<double>(report.total);
	}
	return report;
}

std::string DataQualityReport::toString() const {
	std::ostringstream oss;
	oss << "Experiments: " << total << ", complete: " << complete;
	for (const auto &entry : per_kind) {
		oss << "\n  " << processKindName(entry.first) << ": " << entry.second.missing << " missing ("
		    << utils::formatNumber(entry.second.missing_percentage) << "%)";
	}
	return oss.str();
}

FeatureTable Dataset::getData(const config::ExtractionConfig &config, const ExtractionOptions &options,
                              const features::FeatureLibrary &library) const {
	config.validate();
	if (class_column_ == "workpiece_id") {
		throw ConfigError("The label column cannot be named 'workpiece_id'.");
	}
	for (const auto &column : config.plannedColumns()) {
		if (column == "workpiece_id" || column == class_column_) {
			throw ConfigError("Feature column '" + column + "' clashes with a dataset column.");
		}
	}

	std::vector<const config::SeriesEntry *> plan;
	for (auto kind : kAllProcessKinds) {
		for (const auto *entry : config.entriesFor(kind)) {
			if (entry->use_series) {
				plan.push_back(entry);
			}
		}
	}

	// Columns of each entry in first-seen order; the groups themselves keep plan order.
	std::vector<std::vector<std::string>> groups(plan.size());
	std::vector<std::unordered_set<std::string>> group_seen(plan.size());

	auto labels = getClassLabels();
	std::vector<FeatureRow> rows;
	std::size_t skipped = 0;
	for (std::size_t i = 0; i < experiments_.size(); ++i) {
		const auto &experiment = experiments_[i];
		if (options.complete_only && !experiment.isComplete()) {
			PROCCHAIN_DEBUG("Workpiece {}: incomplete, skipped", experiment.workpieceId());
			++skipped;
			continue;
		}
		FeatureRow row;
		row.set("workpiece_id", static_cast<double>(experiment.workpieceId()));
		for (std::size_t j = 0; j < plan.size(); ++j) {
			const auto *recording = experiment.recording(plan[j]->kind);
			if (!recording) {
				continue;
			}
			auto part = recording->getEntryData(*plan[j], config.policyFor(*plan[j]), library);
			for (const auto &column : part.columns()) {
				if (group_seen[j].insert(column).second) {
					groups[j].push_back(column);
				}
			}
			row.append(std::move(part));
		}
		row.set(class_column_, labels[i] ? FeatureValue(*labels[i]) : FeatureValue());
		rows.push_back(std::move(row));
	}

	std::vector<std::string> columns {"workpiece_id"};
	for (auto &group : groups) {
		columns.insert(columns.end(), std::make_move_iterator(group.begin()), std::make_move_iterator(group.end()));
	}
	columns.push_back(class_column_);
	FeatureTable table(std::move(columns), std::move(rows));

	PROCCHAIN_INFO("Extracted {} rows x {} columns ({} incomplete experiments skipped)", table.rowCount(),
	               table.columnCount(), skipped);
	return options.explode ? table.exploded() : table;
}

} // namespace procchain::core
