#include "procchain/core/recording.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/core/schema.hpp"
#include "procchain/utils/logging.hpp"

namespace procchain::core {

Recording::Recording(WorkpieceId workpiece_id, ProcessKind kind, StaticAttributes static_data,
                     SerialSeries serial_data)
    : workpiece_id_(workpiece_id), kind_(kind), static_(std::move(static_data)), serial_(std::move(serial_data)) {
}

std::string Recording::columnPrefix(const std::string &series_name) const {
	return std::string(processKindName(kind_)) + "_" + series_name;
}

FeatureRow Recording::getData(const config::ExtractionConfig &config, const features::FeatureLibrary &library) const {
	FeatureRow row;
	for (const auto *entry : config.entriesFor(kind_)) {
		if (entry->use_series) {
			row.append(getEntryData(*entry, config.policyFor(*entry), library));
		}
	}
	return row;
}

FeatureRow Recording::getEntryData(const config::SeriesEntry &entry, config::DataQualityPolicy policy,
                                   const features::FeatureLibrary &library) const {
	FeatureRow row;
	if (policy == config::DataQualityPolicy::Raise) {
		extractEntry(entry, library, row);
		return row;
	}
	try {
		extractEntry(entry, library, row);
	} catch (const DataQualityError &e) {
		PROCCHAIN_WARN("Workpiece {}: skipping {}: {}", workpiece_id_, columnPrefix(entry.series_name), e.what());
		return FeatureRow {};
	}
	return row;
}

const Series *Recording::findSeries(const std::string &name) const {
	if (const auto *series = serial_.find(name)) {
		return series;
	}
	if (serial_.hasTimeAxis() && name == schemaFor(kind_).time_series) {
		return &serial_.timeAxis();
	}
	return nullptr;
}

void Recording::extractEntry(const config::SeriesEntry &entry, const features::FeatureLibrary &library,
                             FeatureRow &row) const {
	const auto prefix = columnPrefix(entry.series_name);

	const Series *serial = nullptr;
	const StaticValue *scalar = nullptr;
	switch (entry.source) {
	case config::SeriesSource::Serial:
		serial = findSeries(entry.series_name);
		break;
	case config::SeriesSource::Static:
		scalar = static_.find(entry.series_name);
		break;
	case config::SeriesSource::Auto:
		serial = findSeries(entry.series_name);
		if (!serial) {
			scalar = static_.find(entry.series_name);
		}
		break;
	}

	if (scalar) {
		row.set(prefix, toFeatureValue(*scalar));
		return;
	}
	if (!serial || serial->empty()) {
		PROCCHAIN_DEBUG("Workpiece {}: no data for {}", workpiece_id_, prefix);
		return;
	}

	Series data = *serial;
	if (!entry.preprocessing.empty()) {
		auto pipeline = entry.preprocessing.buildPipeline(serial_.timeAxis());
		pipeline.fitTransform(data);
	}

	auto result = features::ExtractFeatures(data, entry.method, library);
	switch (result.shape) {
	case features::ExtractionResult::Shape::Passthrough:
		row.set(prefix, std::move(result.values));
		break;
	case features::ExtractionResult::Shape::Indexed:
		for (std::size_t i = 0; i < result.values.size(); ++i) {
			row.set(prefix + "_" + std::to_string(i), result.values[i]);
		}
		break;
	case features::ExtractionResult::Shape::Named:
		for (std::size_t i = 0; i < result.values.size(); ++i) {
			row.set(prefix + "_" + result.names[i], result.values[i]);
		}
		break;
	}
}

} // namespace procchain::core
