#include "procchain/features/feature_method.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/features/canonical.hpp"
#include "procchain/transform/transformers.hpp"

namespace procchain::features {

std::string_view MethodName(const MethodParams &params) {
	struct Visitor {
		std::string_view operator()(const RawParams &) const {
			return "raw";
		}
		std::string_view operator()(const PaaParams &) const {
			return "paa";
		}
		std::string_view operator()(const StatisticalParams &) const {
			return "statistical";
		}
		std::string_view operator()(const CanonicalParams &) const {
			return "canonical";
		}
	};
	return std::visit(Visitor {}, params);
}

FeatureLibrary FeatureLibrary::Default() {
	FeatureLibrary library;
	library.statistical = StatisticalFeatures;
	library.canonical = ComputeCanonicalFeatures;
	return library;
}

Series PiecewiseAggregate(const Series &series, int64_t segments) {
	const auto length = static_cast<int64_t>(series.size());
	if (segments < 1 || segments > length) {
		throw core::ConfigError("PAA needs 1 <= segments <= series length, got " + std::to_string(segments) +
		                        " segments for " + std::to_string(length) + " samples.");
	}
	const auto k = static_cast<size_t>(segments);
	const size_t base = series.size() / k;
	const size_t remainder = series.size() % k;

	Series result;
	result.reserve(k);
	size_t begin = 0;
	for (size_t i = 0; i < k; ++i) {
		const size_t count = base + (i < remainder ? 1 : 0);
		double sum = 0.0;
		for (size_t j = begin; j < begin + count; ++j) {
			sum += series[j];
		}
		result.push_back(sum / static_cast<double>(count));
		begin += count;
	}
	return result;
}

std::vector<FeatureResult> StatisticalFeatures(const Series &series, const StatisticalParams &params) {
	const auto &registry = FeatureRegistry::Instance();
	const auto config =
	    params.features.empty() ? registry.ConfigFor(params.feature_set) : registry.ConfigForNames(params.features);
	return registry.Compute(series, config);
}

void ValidateMethodSpec(const FeatureMethodSpec &spec) {
	if (const auto *paa = std::get_if<PaaParams>(&spec.params)) {
		if (paa->segments < 1) {
			throw core::ConfigError("PAA segments must be at least 1, got " + std::to_string(paa->segments) + ".");
		}
	}
	if (const auto *stats = std::get_if<StatisticalParams>(&spec.params)) {
		if (!stats->features.empty()) {
			FeatureRegistry::Instance().ConfigForNames(stats->features);
		}
	}
}

std::vector<std::string> PlannedColumnSuffixes(const FeatureMethodSpec &spec) {
	std::vector<std::string> suffixes;
	auto indexed = [&suffixes](std::size_t count) {
		for (std::size_t i = 0; i < count; ++i) {
			suffixes.push_back("_" + std::to_string(i));
		}
	};
	if (const auto *paa = std::get_if<PaaParams>(&spec.params)) {
		indexed(paa->segments > 0 ? static_cast<std::size_t>(paa->segments) : 0);
	} else if (const auto *canonical = std::get_if<CanonicalParams>(&spec.params)) {
		indexed(canonical->catch24 ? kCatch24Count : kCatch22Count);
	} else if (const auto *stats = std::get_if<StatisticalParams>(&spec.params)) {
		const auto &registry = FeatureRegistry::Instance();
		const auto config =
		    stats->features.empty() ? registry.ConfigFor(stats->feature_set) : registry.ConfigForNames(stats->features);
		for (const auto &request : config.requests) {
			if (request.parameters.empty()) {
				suffixes.push_back("_" + request.name);
				continue;
			}
			for (const auto &param : request.parameters) {
				suffixes.push_back("_" + request.name + param.ToSuffixString());
			}
		}
	} else {
		suffixes.emplace_back();
	}
	return suffixes;
}

ExtractionResult ExtractFeatures(const Series &series, const FeatureMethodSpec &spec, const FeatureLibrary &library) {
	Series working = series;
	if (spec.normalize) {
		transform::StandardScaler scaler;
		scaler.fitTransform(working);
	}

	struct Visitor {
		Series &data;
		const FeatureLibrary &library;

		ExtractionResult operator()(const RawParams &) const {
			return {ExtractionResult::Shape::Passthrough, std::move(data), {}};
		}
		ExtractionResult operator()(const PaaParams &params) const {
			return {ExtractionResult::Shape::Indexed, PiecewiseAggregate(data, params.segments), {}};
		}
		ExtractionResult operator()(const StatisticalParams &params) const {
			if (!library.statistical) {
				throw core::ConfigError("No statistical feature function is configured.");
			}
			ExtractionResult result;
			result.shape = ExtractionResult::Shape::Named;
			for (auto &feature : library.statistical(data, params)) {
				result.names.push_back(std::move(feature.name));
				result.values.push_back(feature.value);
			}
			return result;
		}
		ExtractionResult operator()(const CanonicalParams &params) const {
			if (!library.canonical) {
				throw core::ConfigError("No canonical feature function is configured.");
			}
			return {ExtractionResult::Shape::Indexed, library.canonical(data, params.catch24), {}};
		}
	};
	return std::visit(Visitor {working, library}, spec.params);
}

} // namespace procchain::features
