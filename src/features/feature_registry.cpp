#include "procchain/features/feature_types.hpp"
#include "procchain/features/feature_calculators.hpp"
#include "procchain/features/feature_math.hpp"
#include "procchain/core/errors.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace procchain::features {

namespace {

std::string NormalizeDouble(double value) {
	std::ostringstream oss;
	oss.setf(std::ios::fixed, std::ios::floatfield);
	oss.precision(12);
	oss << value;
	auto repr = oss.str();
	while (repr.size() > 2 && repr.back() == '0') {
		repr.pop_back();
	}
	if (!repr.empty() && repr.back() == '.') {
		repr.pop_back();
	}
	return repr;
}

std::string VariantToString(const FeatureParamValue &value) {
	struct Visitor {
		std::string operator()(std::monostate) const {
			return "none";
		}
		std::string operator()(bool v) const {
			return v ? "true" : "false";
		}
		std::string operator()(int64_t v) const {
			return std::to_string(v);
		}
		std::string operator()(double v) const {
			return NormalizeDouble(v);
		}
		std::string operator()(const std::string &v) const {
			return v;
		}
	};
	return std::visit(Visitor {}, value);
}

const std::vector<std::string> &MinimalNames() {
	static const std::vector<std::string> names = {"sum_values", "median",   "mean",    "length",
	                                               "standard_deviation", "variance", "root_mean_square",
	                                               "maximum",    "absolute_maximum", "minimum"};
	return names;
}

// Efficient set additions, with the parameter subsets it uses.
std::vector<FeatureRequest> EfficientAdditions() {
	auto plain = [](const std::string &name) {
		return FeatureRequest {name, {ParameterMap {}}};
	};
	return {
	    plain("skewness"),
	    plain("kurtosis"),
	    plain("abs_energy"),
	    plain("mean_abs_change"),
	    plain("mean_change"),
	    plain("mean_second_derivative_central"),
	    plain("absolute_sum_of_changes"),
	    {"cid_ce", {Params({{"normalize", true}})}},
	    plain("variation_coefficient"),
	    plain("count_above_mean"),
	    plain("count_below_mean"),
	    plain("longest_strike_above_mean"),
	    plain("longest_strike_below_mean"),
	    plain("first_location_of_maximum"),
	    plain("last_location_of_maximum"),
	    plain("first_location_of_minimum"),
	    plain("last_location_of_minimum"),
	    {"ratio_beyond_r_sigma", {Params({{"r", 1.0}}), Params({{"r", 2.0}}), Params({{"r", 3.0}})}},
	    {"quantile", {Params({{"q", 0.1}}), Params({{"q", 0.25}}), Params({{"q", 0.75}}), Params({{"q", 0.9}})}},
	    {"autocorrelation",
	     {Params({{"lag", int64_t {1}}}), Params({{"lag", int64_t {2}}}), Params({{"lag", int64_t {3}}})}},
	    {"linear_trend",
	     {Params({{"attr", std::string("slope")}}), Params({{"attr", std::string("intercept")}}),
	      Params({{"attr", std::string("rvalue")}})}},
	    {"number_crossing_m", {Params({{"m", 0.0}})}},
	    plain("has_duplicate"),
	    plain("has_duplicate_max"),
	    plain("has_duplicate_min"),
	};
}

} // namespace

std::optional<FeatureSet> ParseFeatureSet(std::string_view name) {
	if (name == "minimal") {
		return FeatureSet::Minimal;
	}
	if (name == "efficient") {
		return FeatureSet::Efficient;
	}
	if (name == "comprehensive") {
		return FeatureSet::Comprehensive;
	}
	return std::nullopt;
}

std::string_view FeatureSetName(FeatureSet set) {
	switch (set) {
	case FeatureSet::Minimal:
		return "minimal";
	case FeatureSet::Efficient:
		return "efficient";
	case FeatureSet::Comprehensive:
	default:
		return "comprehensive";
	}
}

std::optional<double> ParameterMap::GetDouble(std::string_view key) const {
	auto it = entries.find(std::string(key));
	if (it == entries.end()) {
		return std::nullopt;
	}
	const auto &value = it->second;
	if (std::holds_alternative<double>(value)) {
		return std::get<double>(value);
	}
	if (std::holds_alternative<int64_t>(value)) {
		return static_cast<double>(std::get<int64_t>(value));
	}
	if (std::holds_alternative<bool>(value)) {
		return std::get<bool>(value) ? 1.0 : 0.0;
	}
	return std::nullopt;
}

std::optional<int64_t> ParameterMap::GetInt(std::string_view key) const {
	auto it = entries.find(std::string(key));
	if (it == entries.end()) {
		return std::nullopt;
	}
	const auto &value = it->second;
	if (std::holds_alternative<int64_t>(value)) {
		return std::get<int64_t>(value);
	}
	if (std::holds_alternative<double>(value)) {
		return static_cast<int64_t>(std::llround(std::get<double>(value)));
	}
	return std::nullopt;
}

std::optional<bool> ParameterMap::GetBool(std::string_view key) const {
	auto it = entries.find(std::string(key));
	if (it == entries.end()) {
		return std::nullopt;
	}
	const auto &value = it->second;
	if (std::holds_alternative<bool>(value)) {
		return std::get<bool>(value);
	}
	if (std::holds_alternative<int64_t>(value)) {
		return std::get<int64_t>(value) != 0;
	}
	return std::nullopt;
}

std::optional<std::string> ParameterMap::GetString(std::string_view key) const {
	auto it = entries.find(std::string(key));
	if (it == entries.end() || !std::holds_alternative<std::string>(it->second)) {
		return std::nullopt;
	}
	return std::get<std::string>(it->second);
}

std::string ParameterMap::ToSuffixString() const {
	std::ostringstream oss;
	for (const auto &kv : entries) {
		oss << "__" << kv.first << "_" << VariantToString(kv.second);
	}
	return oss.str();
}

FeatureRegistry::FeatureRegistry() {
	RegisterBuiltinFeatureCalculators(*this);
	FinalizeDefaultConfig();
}

FeatureRegistry &FeatureRegistry::Instance() {
	static FeatureRegistry registry;
	return registry;
}

void FeatureRegistry::Register(FeatureDefinition def) {
	features_.push_back(std::move(def));
}

void FeatureRegistry::FinalizeDefaultConfig() {
	default_config_.requests.clear();
	for (const auto &feature : features_) {
		FeatureRequest request;
		request.name = feature.name;
		if (feature.default_parameters.empty()) {
			request.parameters.emplace_back();
		} else {
			request.parameters = feature.default_parameters;
		}
		default_config_.requests.push_back(request);
	}
}

const FeatureDefinition *FeatureRegistry::Find(std::string_view name) const {
	for (const auto &feature : features_) {
		if (feature.name == name) {
			return &feature;
		}
	}
	return nullptr;
}

FeatureConfig FeatureRegistry::ConfigFor(FeatureSet set) const {
	if (set == FeatureSet::Comprehensive) {
		return default_config_;
	}
	FeatureConfig config;
	for (const auto &name : MinimalNames()) {
		config.requests.push_back({name, {ParameterMap {}}});
	}
	if (set == FeatureSet::Efficient) {
		for (auto &request : EfficientAdditions()) {
			config.requests.push_back(std::move(request));
		}
	}
	return config;
}

FeatureConfig FeatureRegistry::ConfigForNames(const std::vector<std::string> &names) const {
	FeatureConfig config;
	for (const auto &name : names) {
		const auto *feature = Find(name);
		if (!feature) {
			throw core::ConfigError("Unknown statistical feature '" + name + "'.");
		}
		FeatureRequest request;
		request.name = feature->name;
		request.parameters = feature->default_parameters;
		if (request.parameters.empty()) {
			request.parameters.emplace_back();
		}
		config.requests.push_back(std::move(request));
	}
	return config;
}

std::vector<FeatureResult> FeatureRegistry::Compute(const Series &series, const FeatureConfig &config) const {
	std::vector<FeatureResult> results;
	FeatureCache cache(series);
	for (const auto &request : config.requests) {
		const auto *feature = Find(request.name);
		if (!feature) {
			continue;
		}
		const auto &params =
		    request.parameters.empty() ? std::vector<ParameterMap> {ParameterMap {}} : request.parameters;
		for (const auto &param : params) {
			FeatureResult result;
			result.name = request.name + param.ToSuffixString();
			result.value = feature->calculator(series, param, cache);
			result.is_nan = std::isnan(result.value);
			results.push_back(std::move(result));
		}
	}
	return results;
}

} // namespace procchain::features
