#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/transform/aligner.hpp"

#include <vector>

using namespace procchain::transform;
using tests::helpers::expectSeriesEqual;

TEST_CASE("align pads after the data for post cutoff", "[transform][align]") {
	auto out = align({1.0, 2.0, 3.0}, {5, CutoffPosition::Post, 0.0});
	expectSeriesEqual(out, {1.0, 2.0, 3.0, 0.0, 0.0});
}

TEST_CASE("align truncates the tail for post cutoff", "[transform][align]") {
	auto out = align({1.0, 2.0, 3.0, 4.0, 5.0}, {4, CutoffPosition::Post, 0.0});
	expectSeriesEqual(out, {1.0, 2.0, 3.0, 4.0});
}

TEST_CASE("align keeps the tail for pre cutoff", "[transform][align]") {
	expectSeriesEqual(align({1.0, 2.0, 3.0, 4.0, 5.0}, {3, CutoffPosition::Pre, 0.0}), {3.0, 4.0, 5.0});
	expectSeriesEqual(align({1.0, 2.0}, {4, CutoffPosition::Pre, -1.0}), {-1.0, -1.0, 1.0, 2.0});
}

TEST_CASE("align handles empty input and exact length", "[transform][align]") {
	expectSeriesEqual(align({}, {3, CutoffPosition::Post, 7.0}), {7.0, 7.0, 7.0});
	expectSeriesEqual(align({1.0, 2.0}, {2, CutoffPosition::Pre, 0.0}), {1.0, 2.0});
}

TEST_CASE("align is idempotent and exact-length", "[transform][align]") {
	const std::vector<double> input = tests::helpers::ramp(37);
	for (auto cutoff : {CutoffPosition::Pre, CutoffPosition::Post}) {
		for (int64_t n : {1, 10, 37, 50}) {
			AlignmentSpec spec {n, cutoff, 0.5};
			auto once = align(input, spec);
			REQUIRE(once.size() == static_cast<std::size_t>(n));
			expectSeriesEqual(align(once, spec), once);
		}
	}
}

TEST_CASE("align rejects non-positive target lengths", "[transform][align]") {
	REQUIRE_THROWS_AS(align({1.0}, {0, CutoffPosition::Post, 0.0}), procchain::core::ConfigError);
	REQUIRE_THROWS_AS(LengthAligner({-3, CutoffPosition::Pre, 0.0}), procchain::core::ConfigError);
}

TEST_CASE("LengthAligner reports its settings", "[transform][align]") {
	LengthAligner aligner({4, CutoffPosition::Post, 0.0});
	REQUIRE(aligner.getName() == "align(4,post)");
	std::vector<double> data {1.0, 2.0};
	aligner.fitTransform(data);
	expectSeriesEqual(data, {1.0, 2.0, 0.0, 0.0});
}

TEST_CASE("Cutoff positions parse by name", "[transform][align]") {
	REQUIRE(parseCutoffPosition("pre") == CutoffPosition::Pre);
	REQUIRE(parseCutoffPosition("post") == CutoffPosition::Post);
	REQUIRE_FALSE(parseCutoffPosition("middle").has_value());
}
