#pragma once

#include "procchain/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace procchain::features {

using Series = core::Series;

using FeatureParamValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

struct ParameterMap {
	std::map<std::string, FeatureParamValue> entries;

	bool Has(std::string_view key) const {
		return entries.find(std::string(key)) != entries.end();
	}

	void Set(std::string key, FeatureParamValue value) {
		entries.emplace(std::move(key), std::move(value));
	}

	std::optional<double> GetDouble(std::string_view key) const;
	std::optional<int64_t> GetInt(std::string_view key) const;
	std::optional<bool> GetBool(std::string_view key) const;
	std::optional<std::string> GetString(std::string_view key) const;

	/// Column suffix "__<key>_<value>" per entry, empty for no parameters.
	std::string ToSuffixString() const;
};

inline ParameterMap Params(std::initializer_list<std::pair<std::string, FeatureParamValue>> initializer) {
	ParameterMap param_map;
	for (const auto &entry : initializer) {
		param_map.entries.insert(entry);
	}
	return param_map;
}

struct FeatureResult {
	std::string name;
	double value;
	bool is_nan = false;
};

struct FeatureCache;

using FeatureCalculatorFn = std::function<double(const Series &, const ParameterMap &, FeatureCache &)>;

struct FeatureDefinition {
	std::string name;
	std::vector<ParameterMap> default_parameters;
	FeatureCalculatorFn calculator;
};

struct FeatureRequest {
	std::string name;
	std::vector<ParameterMap> parameters;
};

struct FeatureConfig {
	std::vector<FeatureRequest> requests;
};

/// Named groups of calculators, from cheapest to most complete.
enum class FeatureSet {
	Minimal,
	Efficient,
	Comprehensive
};

std::optional<FeatureSet> ParseFeatureSet(std::string_view name);
std::string_view FeatureSetName(FeatureSet set);

class FeatureRegistry {
public:
	static FeatureRegistry &Instance();

	const FeatureDefinition *Find(std::string_view name) const;
	const FeatureConfig &DefaultConfig() const {
		return default_config_;
	}
	const std::vector<FeatureDefinition> &Definitions() const {
		return features_;
	}

	/// Requests making up a feature set; Comprehensive equals DefaultConfig().
	FeatureConfig ConfigFor(FeatureSet set) const;

	/**
	 * @brief Requests for explicitly named calculators with their default parameters.
	 * @throws core::ConfigError for a name that is not registered.
	 */
	FeatureConfig ConfigForNames(const std::vector<std::string> &names) const;

	std::vector<FeatureResult> Compute(const Series &series, const FeatureConfig &config) const;

	void Register(FeatureDefinition def);
	void FinalizeDefaultConfig();

private:
	FeatureRegistry();
	std::vector<FeatureDefinition> features_;
	FeatureConfig default_config_;
};

} // namespace procchain::features
