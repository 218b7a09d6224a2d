#include <catch2/catch_test_macros.hpp>

#include "common/corpus_fixtures.hpp"
#include "common/series_helpers.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/io/file_data_source.hpp"

#include <cmath>
#include <variant>

using namespace procchain;
using procchain::core::ProcessKind;
using tests::fixtures::TempDirectory;
using tests::fixtures::writeSampleCorpus;
using tests::helpers::expectSeriesEqual;

TEST_CASE("FileDataSource resolves serial paths from static tables", "[io][source]") {
	TempDirectory dir;
	writeSampleCorpus(dir);
	io::FileDataSource source(dir.path().string());

	auto upper = source.resolvePath(17401, ProcessKind::UpperInjection);
	REQUIRE(upper.workpiece_id == 17401);
	REQUIRE(upper.kind == ProcessKind::UpperInjection);
	REQUIRE(upper.serial_path == dir.file("injection_molding/upper_workpiece/serial_data/u17401.csv"));

	auto right = source.resolvePath(17402, ProcessKind::ScrewRight);
	REQUIRE(right.serial_path == dir.file("screw_driving/serial_data/s17402_r.json"));
	REQUIRE(right.static_row.getText("workpiece_result") == "NOK");

	REQUIRE_THROWS_AS(source.resolvePath(17403, ProcessKind::ScrewLeft), core::NotFoundError);
	REQUIRE_THROWS_AS(source.resolvePath(99999, ProcessKind::UpperInjection), core::NotFoundError);
}

TEST_CASE("FileDataSource parses each source format", "[io][source]") {
	TempDirectory dir;
	writeSampleCorpus(dir);
	io::FileDataSource source(dir.path().string());

	SECTION("upper injection CSV") {
		auto recording = source.parse(source.resolvePath(17401, ProcessKind::UpperInjection));
		expectSeriesEqual(recording.serial_data.timeAxis(), {0.0, 0.1, 0.2, 0.3, 0.4});
		expectSeriesEqual(recording.serial_data.at("injection_pressure_actual"), {1, 2, 3, 4, 5});
		REQUIRE(recording.static_data.getNumber("cycle_time") == 21.5);
		REQUIRE(recording.static_data.getText("machine") == "A");
	}

	SECTION("static cells keep their type") {
		auto recording = source.parse(source.resolvePath(17402, ProcessKind::UpperInjection));
		REQUIRE(std::get<int64_t>(recording.static_data.at("cycle_time")) == 22);
		auto blank = source.parse(source.resolvePath(17403, ProcessKind::UpperInjection));
		REQUIRE(core::isEmpty(blank.static_data.at("cycle_time")));
	}

	SECTION("lower injection text") {
		auto recording = source.parse(source.resolvePath(17401, ProcessKind::LowerInjection));
		expectSeriesEqual(recording.serial_data.timeAxis(), {0.0, 0.1, 0.2});
		expectSeriesEqual(recording.serial_data.at("injection_pressure_actual"), {5, 6, 7});
		expectSeriesEqual(recording.serial_data.at("injection_velocity"), {7, 8, 9});
	}

	SECTION("screw driving JSON") {
		auto recording = source.parse(source.resolvePath(17401, ProcessKind::ScrewLeft));
		const auto &serial = recording.serial_data;
		expectSeriesEqual(serial.at("torque"), {0.1, 0.2, 0.3, 1.0, 1.5});
		expectSeriesEqual(serial.at("angle"), {1, 2, 3, 4, std::nan("")});
		REQUIRE(serial.at("torqueRed").empty());
		REQUIRE(serial.at("angleRed").empty());
		REQUIRE(serial.steps().size() == 2);
		REQUIRE(recording.static_data.getText("step_names") == "Finding|Tightening");
		REQUIRE(recording.static_data.getText("workpiece_location") == "left");
	}
}

TEST_CASE("FileDataSource reports missing and broken files", "[io][source]") {
	TempDirectory dir;
	writeSampleCorpus(dir);
	io::FileDataSource source(dir.path().string());

	SECTION("missing serial file") {
		auto location = source.resolvePath(17401, ProcessKind::UpperInjection);
		location.serial_path = dir.file("injection_molding/upper_workpiece/serial_data/absent.csv");
		REQUIRE_THROWS_AS(source.parse(location), core::NotFoundError);
	}

	SECTION("missing static table") {
		io::FileDataSource empty_root(dir.file("nowhere"));
		REQUIRE_THROWS_AS(empty_root.resolvePath(17401, ProcessKind::LowerInjection), core::NotFoundError);
	}

	SECTION("text without data marker") {
		dir.write("injection_molding/lower_workpiece/serial_data/l17402.txt", "no marker here\n0.0;1;2;3;4\n");
		auto location = source.resolvePath(17402, ProcessKind::LowerInjection);
		REQUIRE_THROWS_AS(source.parse(location), core::ParseError);
	}

	SECTION("invalid JSON") {
		dir.write("screw_driving/serial_data/s17402_l.json", "{\"tightening steps\": [");
		auto location = source.resolvePath(17402, ProcessKind::ScrewLeft);
		REQUIRE_THROWS_AS(source.parse(location), core::ParseError);
	}

	SECTION("ragged CSV row") {
		dir.write("injection_molding/upper_workpiece/serial_data/u17402.csv", ",time,melt_volume\n0,0.0,1\n1,0.1\n");
		auto location = source.resolvePath(17402, ProcessKind::UpperInjection);
		REQUIRE_THROWS_AS(source.parse(location), core::ParseError);
	}
}
