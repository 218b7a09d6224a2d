#include <catch2/catch_test_macros.hpp>

#include "common/corpus_fixtures.hpp"
#include "common/series_helpers.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/core/recording.hpp"

#include <cmath>
#include <string>

using namespace procchain;
using procchain::core::ProcessKind;
using tests::helpers::expectSeriesEqual;

namespace {

config::SeriesEntry makeEntry(const std::string &name, features::MethodParams params) {
	config::SeriesEntry entry;
	entry.kind = ProcessKind::UpperInjection;
	entry.series_name = name;
	entry.use_series = true;
	entry.method.params = std::move(params);
	return entry;
}

core::Recording upperRecording() {
	auto raw = tests::fixtures::makeRecording({{"injection_pressure_actual", {1.0, 2.0, 3.0, 4.0, 5.0}},
	                                           {"melt_volume", {50.0, std::nan(""), 46.0}},
	                                           {"state", {}}});
	raw.static_data.set("cycle_time", int64_t {22});
	raw.static_data.set("machine", std::string("B"));
	return core::Recording(17401, ProcessKind::UpperInjection, raw.static_data, raw.serial_data);
}

} // namespace

TEST_CASE("Raw entries pass the series through", "[core][recording]") {
	config::ExtractionConfig config;
	config.entries.push_back(makeEntry("injection_pressure_actual", features::RawParams {}));
	auto row = upperRecording().getData(config);
	REQUIRE(row.columns() == std::vector<std::string> {"upper-injection_injection_pressure_actual"});
	expectSeriesEqual(std::get<core::Series>(row.at("upper-injection_injection_pressure_actual")), {1, 2, 3, 4, 5});
}

TEST_CASE("Aligned PAA columns are indexed", "[core][recording]") {
	auto entry = makeEntry("injection_pressure_actual", features::PaaParams {2});
	entry.preprocessing.alignment = transform::AlignmentSpec {4, transform::CutoffPosition::Post, 0.0};
	config::ExtractionConfig config;
	config.entries.push_back(entry);

	auto row = upperRecording().getData(config);
	REQUIRE(row.size() == 2);
	REQUIRE(row.number("upper-injection_injection_pressure_actual_0") == 1.5);
	REQUIRE(row.number("upper-injection_injection_pressure_actual_1") == 3.5);
}

TEST_CASE("Static values and missing series", "[core][recording]") {
	config::ExtractionConfig config;
	config.entries.push_back(makeEntry("cycle_time", features::RawParams {}));
	config.entries.push_back(makeEntry("machine", features::RawParams {}));
	config.entries.push_back(makeEntry("state", features::RawParams {}));
	config.entries.push_back(makeEntry("no_such_series", features::RawParams {}));
	auto disabled = makeEntry("injection_pressure_actual", features::RawParams {});
	disabled.use_series = false;
	config.entries.push_back(disabled);

	auto row = upperRecording().getData(config);
	REQUIRE(row.columns() == std::vector<std::string> {"upper-injection_cycle_time", "upper-injection_machine"});
	REQUIRE(row.number("upper-injection_cycle_time") == 22.0);
	REQUIRE(std::get<std::string>(row.at("upper-injection_machine")) == "B");
}

TEST_CASE("Serial source ignores static attributes", "[core][recording]") {
	auto entry = makeEntry("cycle_time", features::RawParams {});
	entry.source = config::SeriesSource::Serial;
	config::ExtractionConfig config;
	config.entries.push_back(entry);
	REQUIRE(upperRecording().getData(config).empty());
}

TEST_CASE("Statistical and canonical columns", "[core][recording]") {
	features::StatisticalParams stats;
	stats.feature_set = features::FeatureSet::Minimal;
	config::ExtractionConfig config;
	config.entries.push_back(makeEntry("injection_pressure_actual", stats));

	auto row = upperRecording().getData(config);
	REQUIRE(row.size() == 10);
	REQUIRE(row.number("upper-injection_injection_pressure_actual_mean") == 3.0);
	REQUIRE(row.number("upper-injection_injection_pressure_actual_maximum") == 5.0);

	config.entries.front().method.params = features::CanonicalParams {false};
	auto canonical = upperRecording().getData(config);
	REQUIRE(canonical.size() == 22);
	REQUIRE(canonical.has("upper-injection_injection_pressure_actual_21"));
}

TEST_CASE("Data quality policy", "[core][recording]") {
	auto volume = makeEntry("melt_volume", features::RawParams {});
	volume.method.normalize = true;
	config::ExtractionConfig config;
	config.entries.push_back(makeEntry("injection_pressure_actual", features::PaaParams {1}));
	config.entries.push_back(volume);

	REQUIRE_THROWS_AS(upperRecording().getData(config), core::DataQualityError);

	config.entries.back().on_data_quality_error = config::DataQualityPolicy::Skip;
	auto row = upperRecording().getData(config);
	REQUIRE(row.columns() == std::vector<std::string> {"upper-injection_injection_pressure_actual_0"});
	REQUIRE(row.number("upper-injection_injection_pressure_actual_0") == 3.0);
}

TEST_CASE("PAA longer than the series is a configuration error", "[core][recording]") {
	config::ExtractionConfig config;
	config.entries.push_back(makeEntry("injection_pressure_actual", features::PaaParams {6}));
	config.default_policy = config::DataQualityPolicy::Skip;
	REQUIRE_THROWS_AS(upperRecording().getData(config), core::ConfigError);
}

TEST_CASE("The time axis wins over a static attribute of the same name", "[core][recording]") {
	auto raw = tests::fixtures::makeRecording({{"torque", {0.1, 0.2, 0.3}}});
	raw.serial_data.setTimeAxis({0.0, 0.1, 0.2});
	raw.static_data.set("time", std::string("2021-03-04 10:15"));
	core::Recording recording(17401, ProcessKind::ScrewLeft, raw.static_data, raw.serial_data);

	auto entry = makeEntry("time", features::RawParams {});
	entry.kind = ProcessKind::ScrewLeft;
	config::ExtractionConfig config;
	config.entries.push_back(entry);
	auto row = recording.getData(config);
	REQUIRE(row.columns() == std::vector<std::string> {"screw-left_time"});
	expectSeriesEqual(std::get<core::Series>(row.at("screw-left_time")), {0.0, 0.1, 0.2});

	config.entries.front().source = config::SeriesSource::Static;
	row = recording.getData(config);
	REQUIRE(std::get<std::string>(row.at("screw-left_time")) == "2021-03-04 10:15");

	auto no_axis = tests::fixtures::makeRecording({{"torque", {0.1}}});
	no_axis.static_data.set("time", std::string("late"));
	core::Recording untimed(17402, ProcessKind::ScrewLeft, no_axis.static_data, no_axis.serial_data);
	config.entries.front().source = config::SeriesSource::Auto;
	REQUIRE(std::get<std::string>(untimed.getData(config).at("screw-left_time")) == "late");
}

TEST_CASE("Entry data honours the quality policy", "[core][recording]") {
	auto entry = makeEntry("melt_volume", features::RawParams {});
	entry.method.normalize = true;
	REQUIRE_THROWS_AS(upperRecording().getEntryData(entry, config::DataQualityPolicy::Raise), core::DataQualityError);
	REQUIRE(upperRecording().getEntryData(entry, config::DataQualityPolicy::Skip).empty());

	auto raw = makeEntry("injection_pressure_actual", features::RawParams {});
	auto row = upperRecording().getEntryData(raw, config::DataQualityPolicy::Raise);
	REQUIRE(row.columns() == std::vector<std::string> {"upper-injection_injection_pressure_actual"});
}
