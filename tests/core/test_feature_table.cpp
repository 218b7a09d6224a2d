#include <catch2/catch_test_macros.hpp>

#include "procchain/core/feature_table.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace procchain::core;

namespace {

FeatureTable sampleTable() {
	FeatureRow first;
	first.set("a", 1.5);
	first.set("b", std::string("x,y"));
	first.set("c", Series {1.0, 2.0});

	FeatureRow second;
	second.set("a", std::nan(""));
	second.set("c", Series {5.0});
	second.set("d", 3.0);

	return FeatureTable({first, second});
}

} // namespace

TEST_CASE("FeatureRow keeps insertion order and rejects duplicates", "[core][table]") {
	FeatureRow row;
	row.set("z", 1.0);
	row.set("a", 2.0);
	REQUIRE(row.columns() == std::vector<std::string> {"z", "a"});
	REQUIRE(row.number("a") == 2.0);
	REQUIRE_THROWS_AS(row.set("z", 3.0), std::logic_error);
	REQUIRE_THROWS_AS(row.at("missing"), std::out_of_range);

	FeatureRow other;
	other.set("a", 5.0);
	REQUIRE_THROWS_AS(row.append(other), std::logic_error);
}

TEST_CASE("FeatureTable unions columns in first-seen order", "[core][table]") {
	auto table = sampleTable();
	REQUIRE(table.rowCount() == 2);
	REQUIRE(table.columns() == std::vector<std::string> {"a", "b", "c", "d"});
	REQUIRE(std::holds_alternative<std::monostate>(table.cell(1, "b")));
	REQUIRE(std::get<double>(table.cell(1, "d")) == 3.0);
}

TEST_CASE("FeatureTable CSV output", "[core][table]") {
	std::ostringstream out;
	sampleTable().writeCsv(out);
	REQUIRE(out.str() == "a,b,c,d\n"
	                     "1.5,\"x,y\",[1|2],\n"
	                     "nan,,[5],3\n");
}

TEST_CASE("FeatureTable explodes series columns", "[core][table]") {
	auto wide = sampleTable().exploded();
	REQUIRE(wide.columns() == std::vector<std::string> {"a", "b", "c_0", "c_1", "d"});
	REQUIRE(std::get<double>(wide.cell(0, "c_1")) == 2.0);
	REQUIRE(std::get<double>(wide.cell(1, "c_0")) == 5.0);
	REQUIRE(std::holds_alternative<std::monostate>(wide.cell(1, "c_1")));
}

TEST_CASE("Static values convert to feature cells", "[core][table]") {
	REQUIRE(std::get<double>(toFeatureValue(StaticValue {int64_t {22}})) == 22.0);
	REQUIRE(std::get<std::string>(toFeatureValue(StaticValue {std::string("A")})) == "A");
	REQUIRE(std::holds_alternative<std::monostate>(toFeatureValue(StaticValue {})));
	REQUIRE(formatFeatureValue(Series {0.25, -1.0}) == "[0.25|-1]");
}

TEST_CASE("FeatureTable with a fixed column order", "[core][table]") {
	FeatureRow first;
	first.set("b", 1.0);
	FeatureRow second;
	second.set("c", Series {1.0, 2.0});
	second.set("a", 2.0);
	FeatureTable table({"a", "b", "c", "d"}, {first, second});
	REQUIRE(table.columns() == std::vector<std::string> {"a", "b", "c", "d"});
	REQUIRE(std::holds_alternative<std::monostate>(table.cell(0, "a")));
	REQUIRE(table.exploded().columns() == std::vector<std::string> {"a", "b", "c_0", "c_1", "d"});

	REQUIRE(FeatureTable({"a"}, {}).exploded().columns() == std::vector<std::string> {"a"});
	REQUIRE_THROWS_AS(FeatureTable({"a", "a"}, {}), std::logic_error);
	REQUIRE_THROWS_AS(FeatureTable({"a"}, {second}), std::logic_error);
}
