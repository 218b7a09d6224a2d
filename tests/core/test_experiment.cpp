#include <catch2/catch_test_macros.hpp>

#include "common/corpus_fixtures.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/core/experiment.hpp"
#include "procchain/core/recording_loader.hpp"

#include <memory>
#include <set>

using namespace procchain;
using procchain::core::ProcessKind;
using tests::fixtures::makeRecording;
using tests::fixtures::StubDataSource;

namespace {

std::shared_ptr<StubDataSource> twoKindSource() {
	auto source = std::make_shared<StubDataSource>();
	source->add(5, ProcessKind::UpperInjection, makeRecording({{"melt_volume", {1.0, 2.0}}}));
	source->add(5, ProcessKind::LowerInjection, makeRecording({{"melt_volume", {3.0, 4.0, 5.0}}}));
	return source;
}

config::ExtractionConfig rawMeltVolume() {
	config::ExtractionConfig config;
	for (auto kind : {ProcessKind::UpperInjection, ProcessKind::LowerInjection}) {
		config::SeriesEntry entry;
		entry.kind = kind;
		entry.series_name = "melt_volume";
		entry.use_series = true;
		config.entries.push_back(entry);
	}
	return config;
}

} // namespace

TEST_CASE("RecordingLoader fills schema series", "[core][loader]") {
	core::RecordingLoader loader(ProcessKind::UpperInjection, twoKindSource());
	auto recording = loader.load(5);
	REQUIRE(recording.workpieceId() == 5);
	REQUIRE(recording.kind() == ProcessKind::UpperInjection);
	REQUIRE(recording.serialData().has("injection_pressure_actual"));
	REQUIRE(recording.serialData().at("injection_pressure_actual").empty());
	REQUIRE(recording.serialData().at("melt_volume").size() == 2);

	REQUIRE_THROWS_AS(core::RecordingLoader(ProcessKind::UpperInjection, nullptr), std::invalid_argument);
	REQUIRE_THROWS_AS(loader.load(6), core::NotFoundError);
}

TEST_CASE("Experiment records which processes exist", "[core][experiment]") {
	core::Experiment experiment(5, twoKindSource());
	REQUIRE(experiment.workpieceId() == 5);
	REQUIRE(experiment.getAvailableProcesses() ==
	        std::set<ProcessKind> {ProcessKind::UpperInjection, ProcessKind::LowerInjection});
	REQUIRE(experiment.hasProcess(ProcessKind::LowerInjection));
	REQUIRE_FALSE(experiment.isComplete());
	REQUIRE(experiment.recording(ProcessKind::ScrewLeft) == nullptr);
	REQUIRE(experiment.recording(ProcessKind::UpperInjection) != nullptr);

	auto text = experiment.describe();
	REQUIRE(text.find("2/4 processes") != std::string::npos);
	REQUIRE(text.find("screw-right: missing") != std::string::npos);
}

TEST_CASE("Experiment propagates parse failures", "[core][experiment]") {
	auto source = twoKindSource();
	source->failWith(5, ProcessKind::ScrewRight, "truncated document");
	REQUIRE_THROWS_AS(core::Experiment(5, source), core::ParseError);
}

TEST_CASE("Experiment data concatenates kinds in fixed order", "[core][experiment]") {
	core::Experiment experiment(5, twoKindSource());
	auto row = experiment.getData(rawMeltVolume());
	REQUIRE(row.columns() == std::vector<std::string> {"upper-injection_melt_volume", "lower-injection_melt_volume"});

	auto lower_only = experiment.getData(rawMeltVolume(), std::vector<ProcessKind> {ProcessKind::LowerInjection});
	REQUIRE(lower_only.columns() == std::vector<std::string> {"lower-injection_melt_volume"});

	core::Experiment empty(6, twoKindSource());
	REQUIRE(empty.getAvailableProcesses().empty());
	REQUIRE(empty.getData(rawMeltVolume()).empty());
}
