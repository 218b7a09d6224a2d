#include "procchain/config/extraction_config.hpp"
#include "procchain/core/errors.hpp"

#include <cmath>
#include <memory>
#include <set>
#include <utility>
#include <variant>

namespace procchain::config {

std::string_view seriesSourceName(SeriesSource source) {
	switch (source) {
	case SeriesSource::Serial:
		return "serial";
	case SeriesSource::Static:
		return "static";
	case SeriesSource::Auto:
	default:
		return "auto";
	}
}

std::optional<SeriesSource> parseSeriesSource(std::string_view name) {
	if (name == "auto") {
		return SeriesSource::Auto;
	}
	if (name == "serial") {
		return SeriesSource::Serial;
	}
	if (name == "static") {
		return SeriesSource::Static;
	}
	return std::nullopt;
}

std::optional<DataQualityPolicy> parseDataQualityPolicy(std::string_view name) {
	if (name == "raise") {
		return DataQualityPolicy::Raise;
	}
	if (name == "skip") {
		return DataQualityPolicy::Skip;
	}
	return std::nullopt;
}

transform::Pipeline PreprocessingSpec::buildPipeline(const core::Series &time_axis) const {
	transform::Pipeline pipeline;
	if (negative_values) {
		pipeline.addTransformer(std::make_unique<transform::NegativeValueReplacer>(*negative_values));
	}
	if (resample_distance) {
		pipeline.addTransformer(std::make_unique<transform::UniformTimeResampler>(time_axis, *resample_distance));
	}
	if (alignment) {
		pipeline.addTransformer(std::make_unique<transform::LengthAligner>(*alignment));
	}
	return pipeline;
}

void ExtractionConfig::validate() const {
	std::set<std::pair<core::ProcessKind, std::string>> seen;
	for (const auto &entry : entries) {
		const std::string where =
		    std::string(core::processKindName(entry.kind)) + "." + entry.series_name;
		if (entry.series_name.empty()) {
			throw core::ConfigError("Configuration entry for " + std::string(core::processKindName(entry.kind)) +
			                        " has an empty series name.");
		}
		if (!seen.emplace(entry.kind, entry.series_name).second) {
			throw core::ConfigError("Series " + where + " is configured twice.");
		}
		if (!entry.use_series) {
			continue;
		}
		const auto &pre = entry.preprocessing;
		if (pre.alignment && pre.alignment->target_length <= 0) {
			throw core::ConfigError("Series " + where + ": target_length must be positive.");
		}
		if (pre.resample_distance && !(*pre.resample_distance > 0.0 && std::isfinite(*pre.resample_distance))) {
			throw core::ConfigError("Series " + where + ": target_distance must be a positive number.");
		}
		try {
			features::ValidateMethodSpec(entry.method);
		} catch (const core::ConfigError &e) {
			throw core::ConfigError("Series " + where + ": " + e.what());
		}
		const auto *paa = std::get_if<features::PaaParams>(&entry.method.params);
		if (paa && pre.alignment && paa->segments > pre.alignment->target_length) {
			throw core::ConfigError("Series " + where + ": " + std::to_string(paa->segments) +
			                        " PAA segments exceed the aligned length " +
			                        std::to_string(pre.alignment->target_length) + ".");
		}
	}

	std::set<std::string> columns;
	for (const auto &column : plannedColumns()) {
		if (!columns.insert(column).second) {
			throw core::ConfigError("Column '" + column + "' would be produced by more than one entry.");
		}
	}
}

std::vector<std::string> ExtractionConfig::plannedColumns() const {
	std::vector<std::string> columns;
	for (auto kind : core::kAllProcessKinds) {
		for (const auto *entry : entriesFor(kind)) {
			if (!entry->use_series) {
				continue;
			}
			const auto prefix = std::string(core::processKindName(kind)) + "_" + entry->series_name;
			if (entry->source == SeriesSource::Static) {
				columns.push_back(prefix);
				continue;
			}
			bool has_bare = false;
			for (const auto &suffix : features::PlannedColumnSuffixes(entry->method)) {
				has_bare = has_bare || suffix.empty();
				columns.push_back(prefix + suffix);
			}
			if (entry->source == SeriesSource::Auto && !has_bare) {
				columns.push_back(prefix);
			}
		}
	}
	return columns;
}

std::vector<const SeriesEntry *> ExtractionConfig::entriesFor(core::ProcessKind kind) const {
	std::vector<const SeriesEntry *> result;
	for (const auto &entry : entries) {
		if (entry.kind == kind) {
			result.push_back(&entry);
		}
	}
	return result;
}

} // namespace procchain::config
