#pragma once

#include <memory>
#include <string>
#include <vector>

namespace fcstaccuracy::core {

/**
 * @class Expr
 * @brief An immutable, engine-neutral column expression.
 *
 * Expressions are small trees built with the free functions below (`col`,
 * `lit`, `undefined`, `when`) and the arithmetic operators. Backends either
 * evaluate them directly or lower them to their own expression language.
 * Copies share the underlying tree.
 */
class Expr {
public:
	enum class Kind {
		Column,
		Literal,
		Undefined,
		Unary,
		Binary,
		NullIf,
		When
	};

	enum class UnaryOp {
		Abs,
		Not,
		IsNull
	};

	enum class BinaryOp {
		Add,
		Subtract,
		Multiply,
		Divide,
		Equal
	};

	static Expr columnRef(std::string name);
	static Expr constant(double value);
	static Expr undefinedValue();
	static Expr unary(UnaryOp op, Expr operand);
	static Expr binary(BinaryOp op, Expr lhs, Expr rhs);
	static Expr nullIf(Expr operand, double value);
	static Expr conditional(Expr condition, Expr then_value, Expr otherwise_value);

	Kind kind() const;

	/// Referenced column name. Only meaningful for Kind::Column.
	const std::string &columnName() const;

	/// Constant value for Kind::Literal, comparand for Kind::NullIf.
	double value() const;

	UnaryOp unaryOp() const;
	BinaryOp binaryOp() const;

	/// Child expressions in evaluation order (When: condition, then, otherwise).
	const std::vector<Expr> &operands() const;

	Expr alias(std::string name) const;
	bool hasAlias() const {
		return !alias_.empty();
	}

	/**
	 * @brief Name of the column this expression produces.
	 * @return The alias if set, the column name for a bare reference, empty otherwise.
	 */
	std::string outputName() const;

	/// True for an un-transformed column reference.
	bool isColumnRef() const {
		return kind() == Kind::Column;
	}

	Expr abs() const;
	Expr isNull() const;
	Expr eq(const Expr &other) const;
	Expr nullIf(double value) const;
	Expr operator!() const;

	/// Readable rendering for diagnostics, e.g. `abs((y - model))`.
	std::string toString() const;

private:
	struct Node;

	explicit Expr(std::shared_ptr<const Node> node);

	std::shared_ptr<const Node> node_;
	std::string alias_;
};

Expr operator+(const Expr &lhs, const Expr &rhs);
Expr operator-(const Expr &lhs, const Expr &rhs);
Expr operator*(const Expr &lhs, const Expr &rhs);
Expr operator/(const Expr &lhs, const Expr &rhs);

Expr col(std::string name);
Expr lit(double value);
Expr undefined();

class WhenThen {
public:
	WhenThen(Expr condition, Expr then_value);
	Expr otherwise(Expr otherwise_value) const;

private:
	Expr condition_;
	Expr then_;
};

class When {
public:
	explicit When(Expr condition);
	WhenThen then(Expr then_value) const;

private:
	Expr condition_;
};

/**
 * @brief Starts a conditional expression: `when(c).then(a).otherwise(b)`.
 *
 * Rows where the condition is undefined take the otherwise branch.
 */
When when(Expr condition);

} // namespace fcstaccuracy::core
