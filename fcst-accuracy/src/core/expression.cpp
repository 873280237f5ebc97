#include "fcst-accuracy/core/expression.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace fcstaccuracy::core {

struct Expr::Node {
	Kind kind = Kind::Undefined;
	std::string name;
	double value = 0.0;
	UnaryOp unary_op = UnaryOp::Abs;
	BinaryOp binary_op = BinaryOp::Add;
	std::vector<Expr> operands;
};

namespace {

const char *binarySymbol(Expr::BinaryOp op) {
	switch (op) {
	case Expr::BinaryOp::Add:
		return "+";
	case Expr::BinaryOp::Subtract:
		return "-";
	case Expr::BinaryOp::Multiply:
		return "*";
	case Expr::BinaryOp::Divide:
		return "/";
	case Expr::BinaryOp::Equal:
		return "==";
	}
	return "?";
}

} // namespace

Expr::Expr(std::shared_ptr<const Node> node) : node_(std::move(node)) {
}

Expr Expr::columnRef(std::string name) {
	if (name.empty()) {
		throw std::invalid_argument("Column reference requires a non-empty name.");
	}
	auto node = std::make_shared<Node>();
	node->kind = Kind::Column;
	node->name = std::move(name);
	return Expr(std::move(node));
}

Expr Expr::constant(double value) {
	auto node = std::make_shared<Node>();
	node->kind = Kind::Literal;
	node->value = value;
	return Expr(std::move(node));
}

Expr Expr::undefinedValue() {
	auto node = std::make_shared<Node>();
	node->kind = Kind::Undefined;
	return Expr(std::move(node));
}

Expr Expr::unary(UnaryOp op, Expr operand) {
	auto node = std::make_shared<Node>();
	node->kind = Kind::Unary;
	node->unary_op = op;
	node->operands.push_back(std::move(operand));
	return Expr(std::move(node));
}

Expr Expr::binary(BinaryOp op, Expr lhs, Expr rhs) {
	auto node = std::make_shared<Node>();
	node->kind = Kind::Binary;
	node->binary_op = op;
	node->operands.push_back(std::move(lhs));
	node->operands.push_back(std::move(rhs));
	return Expr(std::move(node));
}

Expr Expr::nullIf(Expr operand, double value) {
	auto node = std::make_shared<Node>();
	node->kind = Kind::NullIf;
	node->value = value;
	node->operands.push_back(std::move(operand));
	return Expr(std::move(node));
}

Expr Expr::conditional(Expr condition, Expr then_value, Expr otherwise_value) {
	auto node = std::make_shared<Node>();
	node->kind = Kind::When;
	node->operands.push_back(std::move(condition));
	node->operands.push_back(std::move(then_value));
	node->operands.push_back(std::move(otherwise_value));
	return Expr(std::move(node));
}

Expr::Kind Expr::kind() const {
	return node_->kind;
}

const std::string &Expr::columnName() const {
	return node_->name;
}

double Expr::value() const {
	return node_->value;
}

Expr::UnaryOp Expr::unaryOp() const {
	return node_->unary_op;
}

Expr::BinaryOp Expr::binaryOp() const {
	return node_->binary_op;
}

const std::vector<Expr> &Expr::operands() const {
	return node_->operands;
}

Expr Expr::alias(std::string name) const {
	if (name.empty()) {
		throw std::invalid_argument("Expression alias must not be empty.");
	}
	Expr aliased(node_);
	aliased.alias_ = std::move(name);
	return aliased;
}

std::string Expr::outputName() const {
	if (!alias_.empty()) {
		return alias_;
	}
	if (node_->kind == Kind::Column) {
		return node_->name;
	}
	return {};
}

Expr Expr::abs() const {
	return unary(UnaryOp::Abs, *this);
}

Expr Expr::isNull() const {
	return unary(UnaryOp::IsNull, *this);
}

Expr Expr::eq(const Expr &other) const {
	return binary(BinaryOp::Equal, *this, other);
}

Expr Expr::nullIf(double value) const {
	return nullIf(*this, value);
}

Expr Expr::operator!() const {
	return unary(UnaryOp::Not, *this);
}

std::string Expr::toString() const {
	std::ostringstream out;
	switch (node_->kind) {
	case Kind::Column:
		out << node_->name;
		break;
	case Kind::Literal:
		out << node_->value;
		break;
	case Kind::Undefined:
		out << "null";
		break;
	case Kind::Unary: {
		const auto operand = node_->operands[0].toString();
		switch (node_->unary_op) {
		case UnaryOp::Abs:
			out << "abs(" << operand << ")";
			break;
		case UnaryOp::Not:
			out << "!(" << operand << ")";
			break;
		case UnaryOp::IsNull:
			out << "is_null(" << operand << ")";
			break;
		}
		break;
	}
	case Kind::Binary:
		out << "(" << node_->operands[0].toString() << " " << binarySymbol(node_->binary_op) << " "
		    << node_->operands[1].toString() << ")";
		break;
	case Kind::NullIf:
		out << "nullif(" << node_->operands[0].toString() << ", " << node_->value << ")";
		break;
	case Kind::When:
		out << "when(" << node_->operands[0].toString() << ").then(" << node_->operands[1].toString()
		    << ").otherwise(" << node_->operands[2].toString() << ")";
		break;
	}
	if (!alias_.empty()) {
		out << " AS " << alias_;
	}
	return out.str();
}

// --- Builders ---

Expr operator+(const Expr &lhs, const Expr &rhs) {
	return Expr::binary(Expr::BinaryOp::Add, lhs, rhs);
}

Expr operator-(const Expr &lhs, const Expr &rhs) {
	return Expr::binary(Expr::BinaryOp::Subtract, lhs, rhs);
}

Expr operator*(const Expr &lhs, const Expr &rhs) {
	return Expr::binary(Expr::BinaryOp::Multiply, lhs, rhs);
}

Expr operator/(const Expr &lhs, const Expr &rhs) {
	return Expr::binary(Expr::BinaryOp::Divide, lhs, rhs);
}

Expr col(std::string name) {
	return Expr::columnRef(std::move(name));
}

Expr lit(double value) {
	return Expr::constant(value);
}

Expr undefined() {
	return Expr::undefinedValue();
}

WhenThen::WhenThen(Expr condition, Expr then_value) : condition_(std::move(condition)), then_(std::move(then_value)) {
}

Expr WhenThen::otherwise(Expr otherwise_value) const {
	return Expr::conditional(condition_, then_, std::move(otherwise_value));
}

When::When(Expr condition) : condition_(std::move(condition)) {
}

WhenThen When::then(Expr then_value) const {
	return WhenThen(condition_, std::move(then_value));
}

When when(Expr condition) {
	return When(std::move(condition));
}

} // namespace fcstaccuracy::core
