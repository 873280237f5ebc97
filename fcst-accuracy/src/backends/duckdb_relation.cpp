#include "fcst-accuracy/backends/duckdb_relation.hpp"
#include "fcst-accuracy/core/errors.hpp"

#include "duckdb/parser/keyword_helper.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fcstaccuracy::backends {

using core::Expr;

namespace {

std::string quoteIdentifier(const std::string &name) {
	return duckdb::KeywordHelper::WriteOptionallyQuoted(name);
}

std::string doubleLiteral(double value) {
	if (std::isnan(value)) {
		return "CAST('NaN' AS DOUBLE)";
	}
	if (std::isinf(value)) {
		return value > 0 ? "CAST('Infinity' AS DOUBLE)" : "CAST('-Infinity' AS DOUBLE)";
	}
	std::ostringstream out;
	out << std::setprecision(17) << value;
	return "CAST(" + out.str() + " AS DOUBLE)";
}

std::string unarySql(const Expr &expr) {
	const auto operand = toDuckDBSql(expr.operands()[0]);
	switch (expr.unaryOp()) {
	case Expr::UnaryOp::Abs:
		return "abs(" + operand + ")";
	case Expr::UnaryOp::Not:
		return "(NOT " + operand + ")";
	case Expr::UnaryOp::IsNull:
		return "(" + operand + " IS NULL)";
	}
	throw std::logic_error("Unhandled unary operator.");
}

std::string binarySql(const Expr &expr) {
	const auto lhs = toDuckDBSql(expr.operands()[0]);
	const auto rhs = toDuckDBSql(expr.operands()[1]);
	switch (expr.binaryOp()) {
	case Expr::BinaryOp::Add:
		return "(" + lhs + " + " + rhs + ")";
	case Expr::BinaryOp::Subtract:
		return "(" + lhs + " - " + rhs + ")";
	case Expr::BinaryOp::Multiply:
		return "(" + lhs + " * " + rhs + ")";
	case Expr::BinaryOp::Divide:
		// Same contract as the in-memory backend: x / 0 is NULL, never an infinity.
		return "(CAST(" + lhs + " AS DOUBLE) / NULLIF(CAST(" + rhs + " AS DOUBLE), 0))";
	case Expr::BinaryOp::Equal:
		return "(" + lhs + " = " + rhs + ")";
	}
	throw std::logic_error("Unhandled binary operator.");
}

duckdb::vector<duckdb::string> quotedKeys(const std::vector<std::string> &keys,
                                          const std::vector<std::string> &columns) {
	duckdb::vector<duckdb::string> quoted;
	for (const auto &key : keys) {
		if (std::find(columns.begin(), columns.end(), key) == columns.end()) {
			throw core::ColumnNotFoundError(key);
		}
		quoted.push_back(quoteIdentifier(key));
	}
	return quoted;
}

} // namespace

std::string toDuckDBSql(const Expr &expr) {
	switch (expr.kind()) {
	case Expr::Kind::Column:
		return quoteIdentifier(expr.columnName());
	case Expr::Kind::Literal:
		return doubleLiteral(expr.value());
	case Expr::Kind::Undefined:
		return "CAST(NULL AS DOUBLE)";
	case Expr::Kind::Unary:
		return unarySql(expr);
	case Expr::Kind::Binary:
		return binarySql(expr);
	case Expr::Kind::NullIf:
		return "NULLIF(" + toDuckDBSql(expr.operands()[0]) + ", " + doubleLiteral(expr.value()) + ")";
	case Expr::Kind::When:
		return "CASE WHEN " + toDuckDBSql(expr.operands()[0]) + " THEN " + toDuckDBSql(expr.operands()[1]) +
		       " ELSE " + toDuckDBSql(expr.operands()[2]) + " END";
	}
	throw std::logic_error("Unhandled expression kind.");
}

// --- DuckDBRelationFrame ---

DuckDBRelationFrame::DuckDBRelationFrame(RelationPtr relation) : relation_(std::move(relation)) {
	if (!relation_) {
		throw core::AdaptationError("Cannot wrap a null DuckDB relation.");
	}
}

std::vector<std::string> DuckDBRelationFrame::columns() const {
	std::vector<std::string> names;
	for (auto &column : relation_->Columns()) {
		names.push_back(column.Name());
	}
	return names;
}

std::unique_ptr<core::ILazyFrame> DuckDBRelationFrame::select(const std::vector<Expr> &exprs) const {
	duckdb::vector<duckdb::string> expressions;
	duckdb::vector<duckdb::string> aliases;
	for (const auto &expr : exprs) {
		const auto name = expr.outputName();
		if (name.empty()) {
			throw std::invalid_argument("Derived expression '" + expr.toString() + "' requires an alias.");
		}
		expressions.push_back(toDuckDBSql(expr));
		aliases.push_back(name);
	}
	return std::make_unique<DuckDBRelationFrame>(relation_->Project(expressions, aliases));
}

std::unique_ptr<core::ILazyFrame> DuckDBRelationFrame::groupBySum(const std::vector<std::string> &keys) const {
	const auto names = columns();
	const auto groups = quotedKeys(keys, names);

	duckdb::vector<duckdb::string> aggregates(groups.begin(), groups.end());
	for (const auto &name : names) {
		if (std::find(keys.begin(), keys.end(), name) != keys.end()) {
			continue;
		}
		const auto quoted = quoteIdentifier(name);
		aggregates.push_back("CAST(COALESCE(SUM(" + quoted + "), 0) AS DOUBLE) AS " + quoted);
	}
	return std::make_unique<DuckDBRelationFrame>(relation_->Aggregate(aggregates, groups));
}

std::unique_ptr<core::ILazyFrame> DuckDBRelationFrame::sort(const std::vector<std::string> &keys) const {
	duckdb::vector<duckdb::string> order;
	for (const auto &key : quotedKeys(keys, columns())) {
		order.push_back(key + " ASC NULLS FIRST");
	}
	return std::make_unique<DuckDBRelationFrame>(relation_->Order(order));
}

} // namespace fcstaccuracy::backends

namespace fcstaccuracy::core {

std::unique_ptr<ILazyFrame> FrameAdapter<backends::RelationPtr>::fromNative(const backends::RelationPtr &relation) {
	if (!relation) {
		throw AdaptationError("Cannot adapt a null DuckDB relation.");
	}
	return std::make_unique<backends::DuckDBRelationFrame>(relation);
}

backends::RelationPtr FrameAdapter<backends::RelationPtr>::toNative(const ILazyFrame &frame) {
	const auto *duck = dynamic_cast<const backends::DuckDBRelationFrame *>(&frame);
	if (duck == nullptr) {
		throw AdaptationError("Cannot convert a '" + frame.backendName() + "' frame to a DuckDB relation.");
	}
	return duck->relation();
}

} // namespace fcstaccuracy::core
