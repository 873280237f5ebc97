#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "duckdb.hpp"
#include "duckdb/common/types/date.hpp"

#include "fcst_accuracy_extension.hpp"
#include "ts_ratio_metric_native.hpp"

#include "fcst-accuracy/utils/logging.hpp"

#include <string>
#include <type_traits>

using namespace duckdb;
using namespace duckdb::ts_ratio_metric_internal;

namespace {

struct ExtensionFixture {
	DuckDB db {nullptr};
	Connection con {db};

	ExtensionFixture() {
		db.LoadStaticExtension<FcstAccuracyExtension>();
		auto created = con.Query(R"(
			CREATE TABLE cv AS SELECT * FROM (VALUES
				('A', DATE '2024-01-01', 10.0, 9.0, NULL),
				('A', DATE '2024-01-01', 20.0, 18.0, 25.0),
				('B', DATE '2024-01-01', 30.0, 33.0, NULL),
				('B', DATE '2024-01-01', 40.0, 36.0, NULL),
				('A', DATE '2024-02-01', 0.0, 1.0, 1.0),
				('B', DATE '2024-02-01', 5.0, 4.0, 6.0)
			) AS t(unique_id, cutoff, y, model1, model2))");
		REQUIRE_FALSE(created->HasError());
	}
};

template <typename T, typename = void>
struct ExposesLogger : std::false_type {};

template <typename T>
struct ExposesLogger<T, std::void_t<decltype(T::getLogger())>> : std::true_type {};

} // namespace

TEST_CASE("Group key types are carried through the frame", "[duckdb][keys]") {
	REQUIRE(ClassifyKeyType(LogicalType::VARCHAR, "id") == KeyKind::VARCHAR);
	REQUIRE(ClassifyKeyType(LogicalType::INTEGER, "id") == KeyKind::INTEGRAL);
	REQUIRE(ClassifyKeyType(LogicalType::DATE, "cutoff") == KeyKind::DATE);
	REQUIRE(ClassifyKeyType(LogicalType::TIMESTAMP, "cutoff") == KeyKind::TIMESTAMP);
	REQUIRE(ClassifyKeyType(LogicalType::TIMESTAMP_TZ, "cutoff") == KeyKind::TIMESTAMP);
	REQUIRE_THROWS_AS(ClassifyKeyType(LogicalType::DOUBLE, "cutoff"), InvalidInputException);

	const auto date = Value::DATE(Date::FromDate(2024, 1, 1));
	const auto cell = KeyValueToCell(date, KeyKind::DATE);
	REQUIRE(CellToKeyValue(cell, KeyKind::DATE, LogicalType::DATE) == date);

	const auto instant = Value::TIMESTAMPTZ(timestamp_tz_t(int64_t(1704067200000000)));
	const auto restored = CellToKeyValue(KeyValueToCell(instant, KeyKind::TIMESTAMP), KeyKind::TIMESTAMP,
	                                     LogicalType::TIMESTAMP_TZ);
	REQUIRE(restored.type() == LogicalType::TIMESTAMP_TZ);
	REQUIRE(restored == instant);

	const auto small = Value::INTEGER(42);
	REQUIRE(CellToKeyValue(KeyValueToCell(small, KeyKind::INTEGRAL), KeyKind::INTEGRAL, LogicalType::INTEGER) == small);

	const auto null_key = CellToKeyValue(KeyValueToCell(Value(LogicalType::VARCHAR), KeyKind::VARCHAR), KeyKind::VARCHAR,
	                                     LogicalType::VARCHAR);
	REQUIRE(null_key.IsNull());
	REQUIRE(null_key.type() == LogicalType::VARCHAR);
}

TEST_CASE_METHOD(ExtensionFixture, "ts_wape groups by cutoff and id", "[duckdb][wape]") {
	auto result = con.Query("SELECT * FROM ts_wape('cv', ['model1', 'model2']) ORDER BY cutoff, unique_id");
	REQUIRE_FALSE(result->HasError());

	REQUIRE(result->ColumnCount() == 4);
	REQUIRE(result->names[0] == "cutoff");
	REQUIRE(result->types[0] == LogicalType::DATE);
	REQUIRE(result->names[1] == "unique_id");
	REQUIRE(result->types[2] == LogicalType::DOUBLE);
	REQUIRE(result->RowCount() == 4);

	REQUIRE(result->GetValue(0, 0) == Value::DATE(Date::FromDate(2024, 1, 1)));
	REQUIRE(result->GetValue(1, 0).ToString() == "A");
	REQUIRE(result->GetValue(1, 1).ToString() == "B");

	REQUIRE(result->GetValue<double>(2, 0) == Catch::Approx(0.1));
	REQUIRE(result->GetValue<double>(2, 1) == Catch::Approx(0.1));
	REQUIRE(result->GetValue(2, 2).IsNull());
	REQUIRE(result->GetValue<double>(2, 3) == Catch::Approx(0.2));

	// model2 only predicted the second row of A and nothing of B in January
	REQUIRE(result->GetValue<double>(3, 0) == Catch::Approx(0.25));
	REQUIRE(result->GetValue(3, 1).IsNull());
	REQUIRE(result->GetValue(3, 2).IsNull());
	REQUIRE(result->GetValue<double>(3, 3) == Catch::Approx(0.2));
}

TEST_CASE_METHOD(ExtensionFixture, "ts_bias keeps the error sign", "[duckdb][bias]") {
	auto result = con.Query("SELECT unique_id, model1 FROM ts_bias('cv', ['model1']) WHERE cutoff = DATE '2024-01-01' "
	                        "ORDER BY unique_id");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue<double>(1, 0) == Catch::Approx(0.1));
	REQUIRE(result->GetValue<double>(1, 1) == Catch::Approx(1.0 / 70.0));
}

TEST_CASE_METHOD(ExtensionFixture, "Named parameters select column roles", "[duckdb][wape]") {
	auto renamed = con.Query("CREATE TABLE renamed AS "
	                         "SELECT unique_id AS series, cutoff AS origin, y AS actual, model1 FROM cv");
	REQUIRE_FALSE(renamed->HasError());

	auto with_origin = con.Query(
	    "SELECT * FROM ts_wape('renamed', ['model1'], id_col := 'series', target_col := 'actual', cutoff_col := 'origin')");
	REQUIRE_FALSE(with_origin->HasError());
	REQUIRE(with_origin->names[0] == "origin");
	REQUIRE(with_origin->names[1] == "series");
	REQUIRE(with_origin->RowCount() == 4);

	// Without a cutoff column the key is the id alone
	auto by_series =
	    con.Query("SELECT * FROM ts_wape('renamed', ['model1'], id_col := 'series', target_col := 'actual') "
	              "ORDER BY series");
	REQUIRE_FALSE(by_series->HasError());
	REQUIRE(by_series->ColumnCount() == 2);
	REQUIRE(by_series->RowCount() == 2);
	// A: (1 + 2 + 1) / 30, B: (3 + 4 + 1) / 75
	REQUIRE(by_series->GetValue<double>(1, 0) == Catch::Approx(4.0 / 30.0));
	REQUIRE(by_series->GetValue<double>(1, 1) == Catch::Approx(8.0 / 75.0));
}

TEST_CASE_METHOD(ExtensionFixture, "Native function accepts the metric name in any case", "[duckdb][native]") {
	auto result = con.Query("SELECT * FROM _ts_ratio_metric_native("
	                        "(SELECT unique_id, y, model1 FROM cv), ['model1'], 'unique_id', 'y', 'cutoff', 'WAPE')");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->ColumnCount() == 2);
	REQUIRE(result->RowCount() == 2);

	auto empty = con.Query("SELECT * FROM _ts_ratio_metric_native("
	                       "(SELECT * FROM cv WHERE false), ['model1'], 'unique_id', 'y', 'cutoff', 'bias')");
	REQUIRE_FALSE(empty->HasError());
	REQUIRE(empty->RowCount() == 0);
}

TEST_CASE_METHOD(ExtensionFixture, "Invalid arguments are reported", "[duckdb][error]") {
	auto missing_model = con.Query("SELECT * FROM ts_wape('cv', ['model9'])");
	REQUIRE(missing_model->HasError());
	REQUIRE(missing_model->GetError().find("model9") != std::string::npos);

	auto missing_target = con.Query("SELECT * FROM ts_bias('cv', ['model1'], target_col := 'actual')");
	REQUIRE(missing_target->HasError());

	auto duplicate = con.Query("SELECT * FROM ts_wape('cv', ['model1', 'model1'])");
	REQUIRE(duplicate->HasError());

	auto target_as_model = con.Query("SELECT * FROM ts_wape('cv', ['y'])");
	REQUIRE(target_as_model->HasError());

	auto unknown_metric = con.Query("SELECT * FROM _ts_ratio_metric_native("
	                                "(SELECT * FROM cv), ['model1'], 'unique_id', 'y', 'cutoff', 'mape')");
	REQUIRE(unknown_metric->HasError());
	REQUIRE(unknown_metric->GetError().find("mape") != std::string::npos);
}

TEST_CASE_METHOD(ExtensionFixture, "TIMESTAMPTZ cutoffs keep their type", "[duckdb][keys]") {
	auto created = con.Query("CREATE TABLE cv_tz AS SELECT unique_id, "
	                         "CAST('2024-01-01 00:00:00+00' AS TIMESTAMPTZ) AS cutoff, y, model1 FROM cv");
	REQUIRE_FALSE(created->HasError());

	auto result = con.Query("SELECT * FROM ts_wape('cv_tz', ['model1']) ORDER BY unique_id");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->types[0] == LogicalType::TIMESTAMP_TZ);
	REQUIRE(result->RowCount() == 2);

	auto expected = con.Query("SELECT CAST('2024-01-01 00:00:00+00' AS TIMESTAMPTZ)");
	REQUIRE(result->GetValue(0, 0) == expected->GetValue(0, 0));
	REQUIRE(result->GetValue(0, 1) == expected->GetValue(0, 0));
	// A: (1 + 2 + 1) / 30, B: (3 + 4 + 1) / 75
	REQUIRE(result->GetValue<double>(2, 0) == Catch::Approx(4.0 / 30.0));
	REQUIRE(result->GetValue<double>(2, 1) == Catch::Approx(8.0 / 75.0));
}

TEST_CASE_METHOD(ExtensionFixture, "Column roles must be distinct", "[duckdb][error]") {
	auto target_as_id = con.Query("SELECT * FROM ts_wape('cv', ['model1'], id_col := 'y')");
	REQUIRE(target_as_id->HasError());
	REQUIRE(target_as_id->GetError().find("cannot also be the id column") != std::string::npos);

	auto cutoff_as_id = con.Query("SELECT * FROM ts_wape('cv', ['model1'], id_col := 'cutoff')");
	REQUIRE(cutoff_as_id->HasError());
	REQUIRE(cutoff_as_id->GetError().find("cannot also be the id or target column") != std::string::npos);

	auto cutoff_as_target = con.Query("SELECT * FROM ts_bias('cv', ['model1'], cutoff_col := 'y')");
	REQUIRE(cutoff_as_target->HasError());
	REQUIRE(cutoff_as_target->GetError().find("cannot also be the id or target column") != std::string::npos);
}

TEST_CASE_METHOD(ExtensionFixture, "Rows without an actual are skipped", "[duckdb][wape]") {
	auto result = con.Query("SELECT * FROM _ts_ratio_metric_native((SELECT * FROM (VALUES "
	                        "('A', NULL, 5.0), ('A', 10.0, 8.0), ('B', NULL, 3.0)) AS t(unique_id, y, model1)), "
	                        "['model1'], 'unique_id', 'y', 'cutoff', 'wape') ORDER BY unique_id");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue<double>(1, 0) == Catch::Approx(0.2));
	REQUIRE(result->GetValue(1, 1).IsNull());
}

TEST_CASE_METHOD(ExtensionFixture, "Parallel scans are scored in full", "[duckdb][parallel]") {
	REQUIRE_FALSE(con.Query("SET threads = 4")->HasError());
	// 5000 series of 120 rows each, every forecast off by exactly one
	auto created = con.Query("CREATE TABLE many AS SELECT "
	                         "'s' || lpad(CAST(i % 5000 AS VARCHAR), 5, '0') AS unique_id, "
	                         "CAST(i AS DOUBLE) + 1 AS y, CAST(i AS DOUBLE) AS model1 "
	                         "FROM range(0, 600000) t(i)");
	REQUIRE_FALSE(created->HasError());

	auto result = con.Query("SELECT * FROM ts_wape('many', ['model1'])");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->RowCount() == 5000);

	// Output arrives sorted by the group key
	for (idx_t row = 1; row < result->RowCount(); row++) {
		INFO("row " << row);
		REQUIRE(result->GetValue(0, row - 1).ToString() < result->GetValue(0, row).ToString());
	}

	// Series k sums y to 120 * k + 120 + 5000 * (0 + 1 + ... + 119)
	REQUIRE(result->GetValue(0, 0).ToString() == "s00000");
	REQUIRE(result->GetValue<double>(1, 0) == Catch::Approx(120.0 / 35700120.0));
	REQUIRE(result->GetValue(0, 4999).ToString() == "s04999");
	REQUIRE(result->GetValue<double>(1, 4999) == Catch::Approx(120.0 / 36300000.0));
}

TEST_CASE_METHOD(ExtensionFixture, "Extension builds carry no engine logger", "[duckdb][logging]") {
	STATIC_REQUIRE_FALSE(ExposesLogger<fcstaccuracy::utils::Logging>::value);

	// An empty model list is the case the engine warns about
	auto result = con.Query("SELECT * FROM ts_wape('cv', CAST([] AS VARCHAR[]))");
	REQUIRE_FALSE(result->HasError());
	REQUIRE(result->ColumnCount() == 2);
	REQUIRE(result->RowCount() == 4);
}
