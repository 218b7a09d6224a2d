#include <catch2/catch_test_macros.hpp>

#include "common/corpus_fixtures.hpp"
#include "procchain/core/errors.hpp"
#include "procchain/io/label_table.hpp"

#include <vector>

using namespace procchain;
using procchain::core::WorkpieceId;
using tests::fixtures::TempDirectory;

namespace {

io::ClassValueTable loadSample(const TempDirectory &dir) {
	tests::fixtures::writeSampleCorpus(dir);
	return io::ClassValueTable::fromCsv(dir.file("class_values.csv"));
}

} // namespace

TEST_CASE("ClassValueTable drops unused workpieces", "[io][labels]") {
	TempDirectory dir;
	auto table = loadSample(dir);
	REQUIRE(table.size() == 3);
	REQUIRE(table.lookup(17402, "class_value_upper_work_piece") == "recyclate_10");
	REQUIRE(table.lookup(17403, "class_value_screw_driving") == "nok");
	REQUIRE_FALSE(table.lookup(12345, "class_value_screw_driving").has_value());
}

TEST_CASE("ClassValueTable filters", "[io][labels]") {
	TempDirectory dir;
	auto table = loadSample(dir);
	const std::string column = "class_value_upper_work_piece";

	io::LabelFilter exact {io::FilterType::Exact, {"control"}};
	REQUIRE(table.query(column, exact) == std::vector<WorkpieceId> {17401});

	io::LabelFilter contains {io::FilterType::Contains, {"recyclate"}};
	REQUIRE(table.query(column, contains) == std::vector<WorkpieceId> {17402, 17403});

	io::LabelFilter list {io::FilterType::List, {"recyclate_20", "control"}};
	REQUIRE(table.query(column, list) == std::vector<WorkpieceId> {17401, 17403});

	io::LabelFilter none {io::FilterType::Exact, {"recyclate"}};
	REQUIRE(table.query(column, none).empty());
}

TEST_CASE("ClassValueTable errors", "[io][labels]") {
	TempDirectory dir;
	auto table = loadSample(dir);
	io::LabelFilter exact {io::FilterType::Exact, {"ok"}};
	REQUIRE_THROWS_AS(table.query("no_such_column", exact), core::ConfigError);
	REQUIRE_THROWS_AS(table.lookup(17401, "no_such_column"), core::ConfigError);

	REQUIRE_THROWS_AS(io::ClassValueTable::fromCsv(dir.file("absent.csv")), core::NotFoundError);

	dir.write("bad_id.csv", ",upper_workpiece_id,class_value_screw_driving\n0,abc,ok\n");
	REQUIRE_THROWS_AS(io::ClassValueTable::fromCsv(dir.file("bad_id.csv")), core::ParseError);

	dir.write("no_id.csv", ",class_value_screw_driving\n0,ok\n");
	REQUIRE_THROWS_AS(io::ClassValueTable::fromCsv(dir.file("no_id.csv")), core::ParseError);
}

TEST_CASE("Filter type names", "[io][labels]") {
	REQUIRE(io::parseFilterType("contains") == io::FilterType::Contains);
	REQUIRE(io::filterTypeName(io::FilterType::List) == "list");
	REQUIRE_FALSE(io::parseFilterType("regex").has_value());
}
