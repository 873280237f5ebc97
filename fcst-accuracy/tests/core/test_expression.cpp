#include <catch2/catch_test_macros.hpp>

#include "fcst-accuracy/core/expression.hpp"

#include <stdexcept>

using fcstaccuracy::core::col;
using fcstaccuracy::core::Expr;
using fcstaccuracy::core::lit;
using fcstaccuracy::core::undefined;
using fcstaccuracy::core::when;

TEST_CASE("Expressions build immutable trees", "[core][expression]") {
	const Expr error = (col("y") - col("model")).abs();

	REQUIRE(error.kind() == Expr::Kind::Unary);
	REQUIRE(error.unaryOp() == Expr::UnaryOp::Abs);
	REQUIRE(error.operands().size() == 1);

	const Expr &difference = error.operands()[0];
	REQUIRE(difference.kind() == Expr::Kind::Binary);
	REQUIRE(difference.binaryOp() == Expr::BinaryOp::Subtract);
	REQUIRE(difference.operands()[0].columnName() == "y");
	REQUIRE(difference.operands()[1].columnName() == "model");

	REQUIRE(error.toString() == "abs((y - model))");
}

TEST_CASE("Expression aliases name the output column", "[core][expression]") {
	const Expr ref = col("y");
	REQUIRE(ref.isColumnRef());
	REQUIRE(ref.outputName() == "y");
	REQUIRE_FALSE(ref.hasAlias());

	const Expr derived = col("y") / lit(2.0);
	REQUIRE(derived.outputName().empty());

	const Expr aliased = derived.alias("half");
	REQUIRE(aliased.hasAlias());
	REQUIRE(aliased.outputName() == "half");
	// Aliasing returns a copy
	REQUIRE(derived.outputName().empty());

	REQUIRE_THROWS_AS(derived.alias(""), std::invalid_argument);
	REQUIRE_THROWS_AS(col(""), std::invalid_argument);
}

TEST_CASE("Conditional expressions keep branch order", "[core][expression]") {
	const Expr masked = when(!col("model").isNull()).then(col("y")).otherwise(undefined());

	REQUIRE(masked.kind() == Expr::Kind::When);
	REQUIRE(masked.operands().size() == 3);
	REQUIRE(masked.operands()[0].kind() == Expr::Kind::Unary);
	REQUIRE(masked.operands()[0].unaryOp() == Expr::UnaryOp::Not);
	REQUIRE(masked.operands()[1].columnName() == "y");
	REQUIRE(masked.operands()[2].kind() == Expr::Kind::Undefined);
	REQUIRE(masked.toString() == "when(!(is_null(model))).then(y).otherwise(null)");
}

TEST_CASE("nullIf and equality carry their comparand", "[core][expression]") {
	const Expr guarded = col("den").nullIf(0.0);
	REQUIRE(guarded.kind() == Expr::Kind::NullIf);
	REQUIRE(guarded.value() == 0.0);
	REQUIRE(guarded.operands()[0].columnName() == "den");

	const Expr is_zero = col("den").eq(lit(0.0));
	REQUIRE(is_zero.binaryOp() == Expr::BinaryOp::Equal);
	REQUIRE(is_zero.operands()[1].kind() == Expr::Kind::Literal);
	REQUIRE(is_zero.operands()[1].value() == 0.0);
}
