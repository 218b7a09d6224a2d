#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/series_helpers.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/features/canonical.hpp"
#include "procchain/features/feature_method.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace procchain::features;
using Catch::Approx;
using tests::helpers::expectSeriesEqual;

TEST_CASE("PiecewiseAggregate averages equal chunks", "[features][paa]") {
	expectSeriesEqual(PiecewiseAggregate({1.0, 2.0, 3.0, 4.0}, 2), {1.5, 3.5});
	expectSeriesEqual(PiecewiseAggregate({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, 3), {1.5, 3.5, 5.5});
}

TEST_CASE("PiecewiseAggregate gives the remainder to the earliest chunks", "[features][paa]") {
	// 7 samples into 3 chunks: sizes 3, 2, 2
	expectSeriesEqual(PiecewiseAggregate({1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0}, 3), {2.0, 4.5, 6.5});
}

TEST_CASE("PiecewiseAggregate with one segment per sample is the identity", "[features][paa]") {
	const auto series = tests::helpers::noisySine(40);
	auto first = PiecewiseAggregate(series, 40);
	REQUIRE(first == series);
	REQUIRE(PiecewiseAggregate(series, 40) == first);
	REQUIRE(PiecewiseAggregate(series, 7).size() == 7);
}

TEST_CASE("PiecewiseAggregate rejects impossible segment counts", "[features][paa]") {
	REQUIRE_THROWS_AS(PiecewiseAggregate({1.0, 2.0}, 0), procchain::core::ConfigError);
	REQUIRE_THROWS_AS(PiecewiseAggregate({1.0, 2.0}, 3), procchain::core::ConfigError);
}

TEST_CASE("ExtractFeatures passes raw series through", "[features][method]") {
	FeatureMethodSpec spec;
	auto result = ExtractFeatures({3.0, 1.0, 2.0}, spec, FeatureLibrary::Default());
	REQUIRE(result.shape == ExtractionResult::Shape::Passthrough);
	expectSeriesEqual(result.values, {3.0, 1.0, 2.0});
}

TEST_CASE("ExtractFeatures normalizes before the method", "[features][method]") {
	FeatureMethodSpec spec;
	spec.params = PaaParams {2};
	spec.normalize = true;
	auto result = ExtractFeatures({1.0, 1.0, 3.0, 3.0}, spec, FeatureLibrary::Default());
	REQUIRE(result.shape == ExtractionResult::Shape::Indexed);
	expectSeriesEqual(result.values, {-1.0, 1.0});
}

TEST_CASE("ExtractFeatures raises data quality errors when normalizing", "[features][method]") {
	FeatureMethodSpec spec;
	spec.normalize = true;
	REQUIRE_THROWS_AS(ExtractFeatures({2.0, 2.0, 2.0}, spec, FeatureLibrary::Default()),
	                  procchain::core::DataQualityError);
	REQUIRE_THROWS_AS(ExtractFeatures({1.0, std::numeric_limits<double>::infinity()}, spec, FeatureLibrary::Default()),
	                  procchain::core::DataQualityError);
}

TEST_CASE("ExtractFeatures names statistical features", "[features][method]") {
	FeatureMethodSpec spec;
	StatisticalParams params;
	params.features = {"mean", "quantile"};
	spec.params = params;
	auto result = ExtractFeatures({1.0, 2.0, 3.0, 4.0, 5.0}, spec, FeatureLibrary::Default());
	REQUIRE(result.shape == ExtractionResult::Shape::Named);
	REQUIRE(result.names.size() == result.values.size());
	REQUIRE(result.names.front() == "mean");
	REQUIRE(result.values.front() == Approx(3.0));
	REQUIRE(result.names[1] == "quantile__q_0.1");
}

TEST_CASE("ExtractFeatures delegates to a custom library", "[features][method]") {
	FeatureLibrary library;
	library.canonical = [](const Series &series, bool catch24) {
		return std::vector<double>(catch24 ? 24 : 22, static_cast<double>(series.size()));
	};
	FeatureMethodSpec spec;
	spec.params = CanonicalParams {true};
	auto result = ExtractFeatures({1.0, 2.0}, spec, library);
	REQUIRE(result.values.size() == 24);
	REQUIRE(result.values[0] == 2.0);

	spec.params = StatisticalParams {};
	REQUIRE_THROWS_AS(ExtractFeatures({1.0, 2.0}, spec, library), procchain::core::ConfigError);
}

TEST_CASE("ValidateMethodSpec catches bad parameters without data", "[features][method]") {
	FeatureMethodSpec spec;
	spec.params = PaaParams {0};
	REQUIRE_THROWS_AS(ValidateMethodSpec(spec), procchain::core::ConfigError);

	StatisticalParams params;
	params.features = {"mean", "no_such_feature"};
	spec.params = params;
	REQUIRE_THROWS_AS(ValidateMethodSpec(spec), procchain::core::ConfigError);

	spec.params = CanonicalParams {};
	REQUIRE_NOTHROW(ValidateMethodSpec(spec));
}

TEST_CASE("Method names follow the configuration vocabulary", "[features][method]") {
	REQUIRE(MethodName(RawParams {}) == "raw");
	REQUIRE(MethodName(PaaParams {3}) == "paa");
}
