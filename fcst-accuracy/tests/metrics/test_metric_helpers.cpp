#include <catch2/catch_test_macros.hpp>

#include "common/frame_helpers.hpp"
#include "fcst-accuracy/backends/memory_frame.hpp"
#include "fcst-accuracy/metrics/metric_helpers.hpp"

#include <memory>

using fcstaccuracy::backends::evaluateNumeric;
using fcstaccuracy::core::col;
using fcstaccuracy::core::Column;
using fcstaccuracy::core::Expr;
using fcstaccuracy::core::Frame;
using fcstaccuracy::metrics::defaultMetricHelpers;
using fcstaccuracy::metrics::IMetricHelpers;
using fcstaccuracy::metrics::NativeMetricHelpers;
using fcstaccuracy::metrics::PortableMetricHelpers;
using fcstaccuracy::metrics::resolveGroupColumns;

TEST_CASE("Group columns include the cutoff only when present", "[metrics][helpers]") {
	const std::vector<std::string> with_cutoff{"unique_id", "cutoff", "y", "model"};
	const std::vector<std::string> without_cutoff{"unique_id", "y", "model"};

	REQUIRE(resolveGroupColumns(with_cutoff, "unique_id", "cutoff") == std::vector<std::string>{"cutoff", "unique_id"});
	REQUIRE(resolveGroupColumns(without_cutoff, "unique_id", "cutoff") == std::vector<std::string>{"unique_id"});
	REQUIRE(resolveGroupColumns(with_cutoff, "unique_id", "origin") == std::vector<std::string>{"unique_id"});
}

TEST_CASE("Both helper implementations guard zero denominators alike", "[metrics][helpers]") {
	Frame frame;
	frame.addColumn(Column::float64("den", {2.0, 0.0, std::nullopt, -4.0}));

	const NativeMetricHelpers native;
	const PortableMetricHelpers portable;

	REQUIRE(native.getName() == "NativeMetricHelpers");
	REQUIRE(portable.getName() == "PortableMetricHelpers");

	const Expr native_expr = native.zeroToUndefined(col("den"));
	const Expr portable_expr = portable.zeroToUndefined(col("den"));
	REQUIRE(native_expr.kind() == Expr::Kind::NullIf);
	REQUIRE(portable_expr.kind() == Expr::Kind::When);

	const auto lhs = evaluateNumeric(frame, native_expr);
	const auto rhs = evaluateNumeric(frame, portable_expr);
	REQUIRE((lhs.valid == rhs.valid).all());
	REQUIRE(lhs.valid(0));
	REQUIRE_FALSE(lhs.valid(1));
	REQUIRE_FALSE(lhs.valid(2));
	REQUIRE(lhs.valid(3));
	REQUIRE(lhs.values(0) == rhs.values(0));
	REQUIRE(lhs.values(3) == rhs.values(3));

	const std::vector<std::string> columns{"unique_id", "cutoff"};
	REQUIRE(native.groupColumns(columns, "unique_id", "cutoff") ==
	        portable.groupColumns(columns, "unique_id", "cutoff"));
}

TEST_CASE("Default helpers are the native ones", "[metrics][helpers]") {
	const std::shared_ptr<const IMetricHelpers> helpers = defaultMetricHelpers();
	REQUIRE(helpers);
	REQUIRE(helpers->getName() == "NativeMetricHelpers");
	REQUIRE(helpers.get() == defaultMetricHelpers().get());
}
