#include "procchain/config/settings_loader.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/utils/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <utility>

namespace procchain::config {

namespace {

using KindSectionFn = std::function<void(core::ProcessKind, const YAML::Node &)>;
using SeriesKey = std::pair<core::ProcessKind, std::string>;

const char *const kGroupKeys[] = {"injection_molding", "screw_driving"};

bool isGroupKey(const std::string &key) {
	for (const char *group : kGroupKeys) {
		if (key == group) {
			return true;
		}
	}
	return false;
}

YAML::Node parseDocument(const std::string &text, const std::string &document) {
	try {
		return YAML::Load(text);
	} catch (const YAML::Exception &e) {
		throw core::ConfigError(document + ": malformed YAML: " + e.what());
	}
}

template <typename T>
T scalarAs(const YAML::Node &node, const std::string &where) {
	if (!node.IsScalar()) {
		throw core::ConfigError(where + ": expected a scalar value.");
	}
	try {
		return node.as<T>();
	} catch (const YAML::Exception &) {
		throw core::ConfigError(where + ": invalid value '" + node.Scalar() + "'.");
	}
}

std::string keyAs(const YAML::Node &key, const std::string &where) {
	if (!key.IsScalar()) {
		throw core::ConfigError(where + ": mapping keys must be plain names.");
	}
	return key.Scalar();
}

// Calls fn for every kind section of a document, resolving nested group keys.
void forEachKindSection(const YAML::Node &root, const std::string &document, const KindSectionFn &fn) {
	if (!root || root.IsNull()) {
		return;
	}
	if (!root.IsMap()) {
		throw core::ConfigError(document + ": top level must be a mapping.");
	}
	for (const auto &section : root) {
		const auto key = keyAs(section.first, document);
		if (key == "defaults") {
			continue;
		}
		if (auto kind = core::parseProcessKind(key)) {
			fn(*kind, section.second);
			continue;
		}
		if (!isGroupKey(key)) {
			throw core::ConfigError(document + ": unknown process kind '" + key + "'.");
		}
		if (section.second.IsNull()) {
			continue;
		}
		if (!section.second.IsMap()) {
			throw core::ConfigError(document + ": '" + key + "' must be a mapping.");
		}
		for (const auto &child : section.second) {
			const auto path = key + "." + keyAs(child.first, document + ": " + key);
			auto kind = core::parseProcessKind(path);
			if (!kind) {
				throw core::ConfigError(document + ": unknown process kind '" + path + "'.");
			}
			fn(*kind, child.second);
		}
	}
}

// Series name -> settings mapping of one kind section; null sections are empty.
template <typename Fn>
void forEachSeries(core::ProcessKind kind, const YAML::Node &section, const std::string &document, Fn &&fn) {
	if (section.IsNull()) {
		return;
	}
	const std::string kind_name(core::processKindName(kind));
	if (!section.IsMap()) {
		throw core::ConfigError(document + ": section '" + kind_name + "' must be a mapping.");
	}
	for (const auto &series : section) {
		const auto name = keyAs(series.first, document + ": " + kind_name);
		const auto where = document + ": " + kind_name + "." + name;
		if (!series.second.IsNull() && !series.second.IsMap()) {
			throw core::ConfigError(where + " must be a mapping.");
		}
		fn(name, series.second, where);
	}
}

transform::NegativeReplacement parseNegativeReplacement(const YAML::Node &node, const std::string &where) {
	if (node.IsNull()) {
		return transform::NegativeReplacement::withValue(0.0);
	}
	if (!node.IsMap()) {
		throw core::ConfigError(where + ".remove_negative_values must be a mapping.");
	}
	const auto value = node["replacement_value"];
	if (!value) {
		return transform::NegativeReplacement::withValue(0.0);
	}
	if (value.IsNull()) {
		return transform::NegativeReplacement::null();
	}
	if (value.IsScalar() && value.Scalar() == "keep") {
		return transform::NegativeReplacement::keep();
	}
	return transform::NegativeReplacement::withValue(scalarAs<double>(value, where + ".replacement_value"));
}

transform::CutoffPosition parseCutoff(const YAML::Node &node, const std::string &where) {
	if (!node) {
		return transform::CutoffPosition::Post;
	}
	const auto text = scalarAs<std::string>(node, where);
	auto position = transform::parseCutoffPosition(text);
	if (!position) {
		throw core::ConfigError(where + ": cutoff position must be 'pre' or 'post', got '" + text + "'.");
	}
	return *position;
}

std::optional<transform::AlignmentSpec> parseAlignment(const YAML::Node &node, const std::string &where) {
	// Nested form: apply_equal_lengths: {target_length, cutoff_position, padding_val}
	if (const auto nested = node["apply_equal_lengths"]) {
		if (nested.IsNull() || (nested.IsScalar() && !scalarAs<bool>(nested, where + ".apply_equal_lengths"))) {
			return std::nullopt;
		}
		if (!nested.IsMap()) {
			throw core::ConfigError(where + ".apply_equal_lengths must be a mapping or false.");
		}
		transform::AlignmentSpec spec;
		spec.target_length = nested["target_length"]
		                         ? scalarAs<int64_t>(nested["target_length"], where + ".target_length")
		                         : 1000;
		spec.cutoff = parseCutoff(nested["cutoff_position"], where + ".cutoff_position");
		if (nested["padding_val"]) {
			spec.padding_value = scalarAs<double>(nested["padding_val"], where + ".padding_val");
		}
		return spec;
	}
	if (!node["target_length"]) {
		return std::nullopt;
	}
	transform::AlignmentSpec spec;
	spec.target_length = scalarAs<int64_t>(node["target_length"], where + ".target_length");
	spec.cutoff = parseCutoff(node["cutoff_position"], where + ".cutoff_position");
	if (node["padding_value"]) {
		spec.padding_value = scalarAs<double>(node["padding_value"], where + ".padding_value");
	} else if (node["padding_val"]) {
		spec.padding_value = scalarAs<double>(node["padding_val"], where + ".padding_val");
	}
	return spec;
}

PreprocessingSpec parsePreprocessing(const YAML::Node &node, const std::string &where) {
	PreprocessingSpec spec;
	if (node.IsNull()) {
		return spec;
	}
	if (const auto negative = node["remove_negative_values"]) {
		spec.negative_values = parseNegativeReplacement(negative, where);
	}
	if (const auto resample = node["resample_uniform_times"]) {
		if (!resample.IsMap() || !resample["target_distance"]) {
			throw core::ConfigError(where + ".resample_uniform_times needs target_distance.");
		}
		const double distance = scalarAs<double>(resample["target_distance"], where + ".target_distance");
		if (!(distance > 0.0)) {
			throw core::ConfigError(where + ": target_distance must be positive.");
		}
		spec.resample_distance = distance;
	}
	spec.alignment = parseAlignment(node, where);
	if (spec.alignment && spec.alignment->target_length <= 0) {
		throw core::ConfigError(where + ": target_length must be positive.");
	}
	return spec;
}

features::MethodParams parseMethod(const YAML::Node &node, const std::string &where) {
	const std::string method = node["method"] ? scalarAs<std::string>(node["method"], where + ".method") : "raw";

	if (method == "raw") {
		return features::RawParams {};
	}
	if (method == "paa") {
		if (!node["segments"]) {
			throw core::ConfigError(where + ": method 'paa' requires 'segments'.");
		}
		features::PaaParams params;
		params.segments = scalarAs<int64_t>(node["segments"], where + ".segments");
		if (params.segments < 1) {
			throw core::ConfigError(where + ": segments must be at least 1.");
		}
		return params;
	}
	if (method == "tsfresh" || method == "statistical") {
		features::StatisticalParams params;
		if (node["feature_set"]) {
			const auto name = scalarAs<std::string>(node["feature_set"], where + ".feature_set");
			auto set = features::ParseFeatureSet(name);
			if (!set) {
				throw core::ConfigError(where + ": unknown feature set '" + name + "'.");
			}
			params.feature_set = *set;
		}
		if (const auto list = node["features"]) {
			if (!list.IsSequence()) {
				throw core::ConfigError(where + ".features must be a list.");
			}
			for (const auto &item : list) {
				params.features.push_back(scalarAs<std::string>(item, where + ".features"));
			}
			features::FeatureRegistry::Instance().ConfigForNames(params.features);
		}
		return params;
	}
	if (method == "catch22" || method == "canonical") {
		features::CanonicalParams params;
		if (node["catch24"]) {
			params.catch24 = scalarAs<bool>(node["catch24"], where + ".catch24");
		} else if (node["use_catch24"]) {
			params.catch24 = scalarAs<bool>(node["use_catch24"], where + ".use_catch24");
		}
		return params;
	}
	throw core::ConfigError(where + ": unknown method '" + method + "'.");
}

SeriesEntry parseEntry(core::ProcessKind kind, const std::string &name, const YAML::Node &node,
                       const std::string &where) {
	SeriesEntry entry;
	entry.kind = kind;
	entry.series_name = name;
	if (node.IsNull()) {
		return entry;
	}
	if (node["use_series"]) {
		entry.use_series = scalarAs<bool>(node["use_series"], where + ".use_series");
	}
	if (node["source"]) {
		const auto text = scalarAs<std::string>(node["source"], where + ".source");
		auto source = parseSeriesSource(text);
		if (!source) {
			throw core::ConfigError(where + ": source must be auto, serial or static, got '" + text + "'.");
		}
		entry.source = *source;
	}
	entry.method.params = parseMethod(node, where);
	if (node["normalize"]) {
		entry.method.normalize = scalarAs<bool>(node["normalize"], where + ".normalize");
	}
	if (node["on_data_quality_error"]) {
		const auto text = scalarAs<std::string>(node["on_data_quality_error"], where + ".on_data_quality_error");
		auto policy = parseDataQualityPolicy(text);
		if (!policy) {
			throw core::ConfigError(where + ": on_data_quality_error must be raise or skip, got '" + text + "'.");
		}
		entry.on_data_quality_error = *policy;
	}
	return entry;
}

std::string readFile(const std::filesystem::path &path) {
	std::ifstream in(path);
	if (!in) {
		throw core::ConfigError("Settings file not found: " + path.string());
	}
	std::ostringstream buffer;
	buffer << in.rdbuf();
	return buffer.str();
}

} // namespace

ExtractionConfig parseSettings(const std::string &processing_yaml, const std::string &extraction_yaml) {
	const auto processing = parseDocument(processing_yaml, "processing.yml");
	const auto extraction = parseDocument(extraction_yaml, "extraction.yml");

	std::map<SeriesKey, PreprocessingSpec> preprocessing;
	forEachKindSection(processing, "processing.yml", [&](core::ProcessKind kind, const YAML::Node &section) {
		forEachSeries(kind, section, "processing.yml",
		              [&](const std::string &name, const YAML::Node &node, const std::string &where) {
			              preprocessing[{kind, name}] = parsePreprocessing(node, where);
		              });
	});

	ExtractionConfig config;
	if (extraction && extraction.IsMap()) {
		if (const auto defaults = extraction["defaults"]) {
			if (defaults.IsMap() && defaults["on_data_quality_error"]) {
				const auto text =
				    scalarAs<std::string>(defaults["on_data_quality_error"], "extraction.yml: defaults.on_data_quality_error");
				auto policy = parseDataQualityPolicy(text);
				if (!policy) {
					throw core::ConfigError("extraction.yml: defaults.on_data_quality_error must be raise or skip.");
				}
				config.default_policy = *policy;
			}
		}
	}
	forEachKindSection(extraction, "extraction.yml", [&](core::ProcessKind kind, const YAML::Node &section) {
		forEachSeries(kind, section, "extraction.yml",
		              [&](const std::string &name, const YAML::Node &node, const std::string &where) {
			              auto entry = parseEntry(kind, name, node, where);
			              auto it = preprocessing.find({kind, name});
			              if (it != preprocessing.end()) {
				              entry.preprocessing = it->second;
			              }
			              config.entries.push_back(std::move(entry));
		              });
	});

	config.validate();
	PROCCHAIN_DEBUG("Parsed extraction settings with {} entries", config.entries.size());
	return config;
}

ExtractionConfig loadSettings(const std::string &settings_dir) {
	const std::filesystem::path dir(settings_dir);
	const auto processing = readFile(dir / "processing.yml");
	const auto extraction = readFile(dir / "extraction.yml");
	PROCCHAIN_INFO("Loading settings from {}", settings_dir);
	return parseSettings(processing, extraction);
}

} // namespace procchain::config
