#include <catch2/catch_test_macros.hpp>

#include "procchain/utils/text.hpp"

#include <limits>

using namespace procchain::utils;

TEST_CASE("splitRecord honours quotes", "[utils][text]") {
	auto fields = splitRecord(R"(a;"b;c";"say ""hi""";)", ';');
	REQUIRE(fields.size() == 4);
	REQUIRE(fields[0] == "a");
	REQUIRE(fields[1] == "b;c");
	REQUIRE(fields[2] == R"(say "hi")");
	REQUIRE(fields[3].empty());
}

TEST_CASE("quoteField only quotes when needed", "[utils][text]") {
	REQUIRE(quoteField("plain", ',') == "plain");
	REQUIRE(quoteField("a,b", ',') == "\"a,b\"");
	REQUIRE(quoteField("a\"b", ',') == "\"a\"\"b\"");
	REQUIRE(quoteField("a,b", ';') == "a,b");
}

TEST_CASE("Number parsing rejects trailing garbage", "[utils][text]") {
	REQUIRE(parseInteger(" 42 ") == 42);
	REQUIRE_FALSE(parseInteger("42.0").has_value());
	REQUIRE_FALSE(parseInteger("").has_value());
	REQUIRE(parseDouble("2.5") == 2.5);
	REQUIRE_FALSE(parseDouble("2.5x").has_value());
}

TEST_CASE("formatNumber prints the shortest exact form", "[utils][text]") {
	REQUIRE(formatNumber(1.5) == "1.5");
	REQUIRE(formatNumber(17401.0) == "17401");
	REQUIRE(formatNumber(0.1) == "0.1");
	REQUIRE(formatNumber(1.0 / 3.0) == "0.3333333333333333");
	REQUIRE(formatNumber(std::numeric_limits<double>::quiet_NaN()) == "nan");
	REQUIRE(formatNumber(-std::numeric_limits<double>::infinity()) == "-inf");
}
