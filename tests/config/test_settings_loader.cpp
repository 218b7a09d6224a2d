#include <catch2/catch_test_macros.hpp>

#include "common/corpus_fixtures.hpp"
#include "procchain/config/settings_loader.hpp"
#include "procchain/core/errors.hpp"

#include <string>
#include <variant>

using namespace procchain;
using procchain::core::ConfigError;
using procchain::core::ProcessKind;

namespace {

const char *kProcessing = R"(
upper-injection:
  injection_pressure_actual:
    target_length: 1000
    cutoff_position: pre
    padding_value: -1.0
    remove_negative_values: {replacement_value: 0.0}
    resample_uniform_times: {target_distance: 0.01}
)";

const char *kExtraction = R"(
defaults:
  on_data_quality_error: skip
upper-injection:
  injection_pressure_actual: {use_series: true, method: paa, segments: 10}
  melt_volume: {use_series: true, method: catch22, normalize: true}
  cycle_time: {use_series: true, source: static}
  state: {use_series: false}
screw-left:
  torque: {use_series: true, method: tsfresh, feature_set: minimal, on_data_quality_error: raise}
)";

} // namespace

TEST_CASE("Settings parse into ordered entries", "[config]") {
	auto config = config::parseSettings(kProcessing, kExtraction);
	REQUIRE(config.entries.size() == 5);
	REQUIRE(config.default_policy == config::DataQualityPolicy::Skip);

	const auto &pressure = config.entries[0];
	REQUIRE(pressure.kind == ProcessKind::UpperInjection);
	REQUIRE(pressure.series_name == "injection_pressure_actual");
	REQUIRE(pressure.use_series);
	REQUIRE(std::get<features::PaaParams>(pressure.method.params).segments == 10);
	REQUIRE(pressure.preprocessing.alignment.has_value());
	REQUIRE(pressure.preprocessing.alignment->target_length == 1000);
	REQUIRE(pressure.preprocessing.alignment->cutoff == transform::CutoffPosition::Pre);
	REQUIRE(pressure.preprocessing.alignment->padding_value == -1.0);
	REQUIRE(pressure.preprocessing.negative_values.has_value());
	REQUIRE(pressure.preprocessing.resample_distance == 0.01);
	REQUIRE(config.policyFor(pressure) == config::DataQualityPolicy::Skip);

	const auto &volume = config.entries[1];
	REQUIRE(std::holds_alternative<features::CanonicalParams>(volume.method.params));
	REQUIRE(volume.method.normalize);
	REQUIRE(volume.preprocessing.empty());

	REQUIRE(config.entries[2].source == config::SeriesSource::Static);
	REQUIRE(std::holds_alternative<features::RawParams>(config.entries[2].method.params));
	REQUIRE_FALSE(config.entries[3].use_series);

	const auto &torque = config.entries[4];
	REQUIRE(torque.kind == ProcessKind::ScrewLeft);
	REQUIRE(std::get<features::StatisticalParams>(torque.method.params).feature_set == features::FeatureSet::Minimal);
	REQUIRE(config.policyFor(torque) == config::DataQualityPolicy::Raise);

	REQUIRE(config.entriesFor(ProcessKind::UpperInjection).size() == 4);
	REQUIRE(config.entriesFor(ProcessKind::LowerInjection).empty());
}

TEST_CASE("Settings accept the nested kind form", "[config]") {
	const char *processing = R"(
injection_molding:
  lower_workpiece:
    melt_volume:
      apply_equal_lengths: {cutoff_position: post, padding_val: 2.5}
)";
	const char *extraction = R"(
injection_molding:
  lower_workpiece:
    melt_volume: {use_series: true, method: raw}
screw_driving:
  right:
    angle: {use_series: true, method: catch22, use_catch24: true}
)";
	auto config = config::parseSettings(processing, extraction);
	REQUIRE(config.entries.size() == 2);
	REQUIRE(config.entries[0].kind == ProcessKind::LowerInjection);
	REQUIRE(config.entries[0].preprocessing.alignment->target_length == 1000);
	REQUIRE(config.entries[0].preprocessing.alignment->padding_value == 2.5);
	REQUIRE(config.entries[1].kind == ProcessKind::ScrewRight);
	REQUIRE(std::get<features::CanonicalParams>(config.entries[1].method.params).catch24);
}

TEST_CASE("Settings reject invalid documents", "[config]") {
	SECTION("paa without segments") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection: {x: {use_series: true, method: paa}}"),
		                  ConfigError);
	}
	SECTION("unknown method") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection: {x: {method: wavelet}}"), ConfigError);
	}
	SECTION("unknown kind") {
		REQUIRE_THROWS_AS(config::parseSettings("", "middle-injection: {x: {method: raw}}"), ConfigError);
	}
	SECTION("unknown feature set") {
		REQUIRE_THROWS_AS(config::parseSettings("", "screw-left: {torque: {method: tsfresh, feature_set: huge}}"),
		                  ConfigError);
	}
	SECTION("wrong value type") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection: {x: {method: paa, segments: many}}"),
		                  ConfigError);
	}
	SECTION("non-positive target length") {
		REQUIRE_THROWS_AS(config::parseSettings("upper-injection: {x: {target_length: 0}}", ""), ConfigError);
	}
	SECTION("bad cutoff") {
		REQUIRE_THROWS_AS(config::parseSettings("upper-injection: {x: {target_length: 5, cutoff_position: mid}}", ""),
		                  ConfigError);
	}
	SECTION("malformed yaml") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection: [unclosed"), ConfigError);
	}
	SECTION("duplicate entry") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection: {x: {method: raw}}\n"
		                                            "injection_molding: {upper_workpiece: {x: {method: raw}}}"),
		                  ConfigError);
	}
	SECTION("sequence as series key") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection:\n  ? [a, b]\n  : {use_series: true}\n"),
		                  ConfigError);
	}
	SECTION("mapping as kind key") {
		REQUIRE_THROWS_AS(config::parseSettings("", "? {upper-injection: x}\n: {x: {method: raw}}\n"), ConfigError);
	}
	SECTION("sequence as processing key") {
		REQUIRE_THROWS_AS(config::parseSettings("upper-injection:\n  ? [x]\n  : {target_length: 5}\n", ""),
		                  ConfigError);
	}
	SECTION("more PAA segments than aligned samples") {
		REQUIRE_THROWS_AS(config::parseSettings("upper-injection: {x: {target_length: 4}}",
		                                        "upper-injection: {x: {use_series: true, method: paa, segments: 10}}"),
		                  ConfigError);
	}
	SECTION("indexed columns clash with another entry") {
		REQUIRE_THROWS_AS(config::parseSettings("", "upper-injection:\n"
		                                            "  melt_volume: {use_series: true, method: paa, segments: 2}\n"
		                                            "  melt_volume_0: {use_series: true, source: static}\n"),
		                  ConfigError);
	}
}

TEST_CASE("Settings ignore unknown keys and default the method", "[config]") {
	auto config = config::parseSettings("", "upper-injection: {x: {use_series: true, colour: blue}}");
	REQUIRE(config.entries.size() == 1);
	REQUIRE(std::holds_alternative<features::RawParams>(config.entries[0].method.params));
}

TEST_CASE("Negative replacement modes", "[config]") {
	auto config = config::parseSettings("upper-injection:\n"
	                                    "  a: {remove_negative_values: {replacement_value: null}}\n"
	                                    "  b: {remove_negative_values: {replacement_value: keep}}\n"
	                                    "  c: {remove_negative_values: {}}\n",
	                                    "upper-injection: {a: {use_series: true}, b: {use_series: true}, "
	                                    "c: {use_series: true}}");
	using Mode = transform::NegativeReplacement::Mode;
	REQUIRE(config.entries[0].preprocessing.negative_values->mode == Mode::Null);
	REQUIRE(config.entries[1].preprocessing.negative_values->mode == Mode::Keep);
	REQUIRE(config.entries[2].preprocessing.negative_values->mode == Mode::Value);
	REQUIRE(config.entries[2].preprocessing.negative_values->value == 0.0);
}

TEST_CASE("Settings load from a directory", "[config]") {
	tests::fixtures::TempDirectory dir;
	dir.write("processing.yml", kProcessing);
	REQUIRE_THROWS_AS(config::loadSettings(dir.path().string()), ConfigError);

	dir.write("extraction.yml", kExtraction);
	auto config = config::loadSettings(dir.path().string());
	REQUIRE(config.entries.size() == 5);
}

TEST_CASE("Programmatic configs are validated", "[config]") {
	config::ExtractionConfig config;
	config::SeriesEntry entry;
	entry.series_name = "x";
	entry.use_series = true;
	entry.method.params = features::PaaParams {0};
	config.entries.push_back(entry);
	REQUIRE_THROWS_AS(config.validate(), ConfigError);

	config.entries[0].method.params = features::PaaParams {2};
	REQUIRE_NOTHROW(config.validate());

	config.entries[0].preprocessing.alignment = transform::AlignmentSpec {0, transform::CutoffPosition::Post, 0.0};
	REQUIRE_THROWS_AS(config.validate(), ConfigError);
}

TEST_CASE("Validation rejects entries producing the same column", "[config]") {
	auto entry = [](const std::string &name, features::MethodParams params, config::SeriesSource source) {
		config::SeriesEntry result;
		result.series_name = name;
		result.use_series = true;
		result.source = source;
		result.method.params = std::move(params);
		return result;
	};

	config::ExtractionConfig config;
	config.entries.push_back(entry("x", features::StatisticalParams {features::FeatureSet::Efficient, {"mean"}},
	                               config::SeriesSource::Serial));
	config.entries.push_back(entry("x_median", features::RawParams {}, config::SeriesSource::Static));
	REQUIRE_NOTHROW(config.validate());
	REQUIRE(config.plannedColumns() ==
	        std::vector<std::string> {"upper-injection_x_mean", "upper-injection_x_median"});

	config.entries.push_back(entry("x_mean", features::RawParams {}, config::SeriesSource::Static));
	try {
		config.validate();
		FAIL("expected ConfigError");
	} catch (const ConfigError &e) {
		REQUIRE(std::string(e.what()).find("upper-injection_x_mean") != std::string::npos);
	}

	// Another kind keeps its own namespace.
	config.entries.back().kind = ProcessKind::LowerInjection;
	REQUIRE_NOTHROW(config.validate());

	// An automatic source may yield the bare name when the series turns out to be static.
	config.entries.push_back(entry("y", features::PaaParams {2}, config::SeriesSource::Auto));
	config.entries.push_back(entry("y", features::RawParams {}, config::SeriesSource::Static));
	config.entries.back().series_name = "y_0";
	REQUIRE_THROWS_AS(config.validate(), ConfigError);
	config.entries.back().series_name = "y";
	config.entries.back().kind = ProcessKind::ScrewRight;
	REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("PAA segments must fit the aligned length", "[config]") {
	config::ExtractionConfig config;
	config::SeriesEntry entry;
	entry.series_name = "x";
	entry.use_series = true;
	entry.method.params = features::PaaParams {10};
	entry.preprocessing.alignment = transform::AlignmentSpec {4, transform::CutoffPosition::Post, 0.0};
	config.entries.push_back(entry);
	REQUIRE_THROWS_AS(config.validate(), ConfigError);

	config.entries[0].method.params = features::PaaParams {4};
	REQUIRE_NOTHROW(config.validate());

	config.entries[0].preprocessing.alignment.reset();
	config.entries[0].method.params = features::PaaParams {10};
	REQUIRE_NOTHROW(config.validate());
}
