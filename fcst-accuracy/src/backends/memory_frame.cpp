#include "fcst-accuracy/backends/memory_frame.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace fcstaccuracy::backends {

using core::Column;
using core::Expr;
using core::Frame;

namespace {

NumericArray constantArray(Eigen::Index rows, double value, bool valid) {
	NumericArray out;
	out.values = Eigen::ArrayXd::Constant(rows, value);
	out.valid = ValidityMask::Constant(rows, valid);
	return out;
}

NumericArray loadColumn(const Frame &frame, const std::string &name) {
	const auto &column = frame.column(name);
	if (!column.isNumeric()) {
		throw core::ColumnTypeError("Column '" + name + "' of type " + core::toString(column.type()) +
		                            " cannot be used in a numeric expression.");
	}
	const auto rows = static_cast<Eigen::Index>(frame.rows());
	NumericArray out = constantArray(rows, 0.0, false);
	for (Eigen::Index i = 0; i < rows; ++i) {
		const auto row = static_cast<std::size_t>(i);
		if (!column.isNull(row)) {
			out.values(i) = column.asDouble(row);
			out.valid(i) = true;
		}
	}
	return out;
}

NumericArray evaluateUnary(const Frame &frame, const Expr &expr) {
	const NumericArray operand = evaluateNumeric(frame, expr.operands()[0]);
	NumericArray out;
	switch (expr.unaryOp()) {
	case Expr::UnaryOp::Abs:
		out.values = operand.values.abs();
		out.valid = operand.valid;
		break;
	case Expr::UnaryOp::Not:
		out.values = (operand.values == 0.0).cast<double>();
		out.valid = operand.valid;
		break;
	case Expr::UnaryOp::IsNull:
		out.values = (!operand.valid).cast<double>();
		out.valid = ValidityMask::Constant(operand.valid.size(), true);
		break;
	}
	return out;
}

NumericArray evaluateBinary(const Frame &frame, const Expr &expr) {
	const NumericArray lhs = evaluateNumeric(frame, expr.operands()[0]);
	const NumericArray rhs = evaluateNumeric(frame, expr.operands()[1]);
	NumericArray out;
	out.valid = lhs.valid && rhs.valid;
	switch (expr.binaryOp()) {
	case Expr::BinaryOp::Add:
		out.values = lhs.values + rhs.values;
		break;
	case Expr::BinaryOp::Subtract:
		out.values = lhs.values - rhs.values;
		break;
	case Expr::BinaryOp::Multiply:
		out.values = lhs.values * rhs.values;
		break;
	case Expr::BinaryOp::Divide:
		// x / 0 is undefined rather than an infinity
		out.valid = out.valid && (rhs.values != 0.0);
		out.values = out.valid.select(lhs.values / rhs.values, 0.0);
		break;
	case Expr::BinaryOp::Equal:
		out.values = (lhs.values == rhs.values).cast<double>();
		break;
	}
	return out;
}

NumericArray evaluateWhen(const Frame &frame, const Expr &expr) {
	const NumericArray condition = evaluateNumeric(frame, expr.operands()[0]);
	const NumericArray then_value = evaluateNumeric(frame, expr.operands()[1]);
	const NumericArray otherwise_value = evaluateNumeric(frame, expr.operands()[2]);

	const ValidityMask take_then = condition.valid && (condition.values != 0.0);
	NumericArray out;
	out.values = take_then.select(then_value.values, otherwise_value.values);
	out.valid = take_then.select(then_value.valid, otherwise_value.valid);
	return out;
}

std::size_t requireColumn(const Frame &frame, const std::string &name) {
	const auto index = frame.columnIndex(name);
	if (!index) {
		throw core::ColumnNotFoundError(name);
	}
	return *index;
}

} // namespace

NumericArray evaluateNumeric(const Frame &frame, const Expr &expr) {
	const auto rows = static_cast<Eigen::Index>(frame.rows());
	switch (expr.kind()) {
	case Expr::Kind::Column:
		return loadColumn(frame, expr.columnName());
	case Expr::Kind::Literal:
		return constantArray(rows, expr.value(), true);
	case Expr::Kind::Undefined:
		return constantArray(rows, 0.0, false);
	case Expr::Kind::Unary:
		return evaluateUnary(frame, expr);
	case Expr::Kind::Binary:
		return evaluateBinary(frame, expr);
	case Expr::Kind::NullIf: {
		NumericArray out = evaluateNumeric(frame, expr.operands()[0]);
		out.valid = out.valid && (out.values != expr.value());
		return out;
	}
	case Expr::Kind::When:
		return evaluateWhen(frame, expr);
	}
	throw std::logic_error("Unhandled expression kind.");
}

Column evaluateColumn(const Frame &frame, const Expr &expr) {
	const auto name = expr.outputName();
	if (name.empty()) {
		throw std::invalid_argument("Derived expression '" + expr.toString() + "' requires an alias.");
	}
	if (expr.isColumnRef()) {
		return frame.column(expr.columnName()).renamed(name);
	}

	const NumericArray result = evaluateNumeric(frame, expr);
	std::vector<Column::Cell> cells;
	cells.reserve(frame.rows());
	for (Eigen::Index i = 0; i < result.values.size(); ++i) {
		if (result.valid(i)) {
			cells.emplace_back(result.values(i));
		} else {
			cells.emplace_back(std::monostate{});
		}
	}
	return Column(name, core::DataType::Float64, std::move(cells));
}

// --- MemoryLazyFrame ---

MemoryLazyFrame::MemoryLazyFrame(Frame frame) : frame_(std::make_shared<const Frame>(std::move(frame))) {
}

MemoryLazyFrame::MemoryLazyFrame(std::shared_ptr<const Frame> frame) : frame_(std::move(frame)) {
}

std::unique_ptr<MemoryLazyFrame> MemoryLazyFrame::borrow(const Frame &frame) {
	std::shared_ptr<const Frame> borrowed(&frame, [](const Frame *) {});
	return std::unique_ptr<MemoryLazyFrame>(new MemoryLazyFrame(std::move(borrowed)));
}

std::vector<std::string> MemoryLazyFrame::columns() const {
	return frame_->columnNames();
}

std::unique_ptr<core::ILazyFrame> MemoryLazyFrame::select(const std::vector<Expr> &exprs) const {
	Frame result;
	for (const auto &expr : exprs) {
		result.addColumn(evaluateColumn(*frame_, expr));
	}
	return std::make_unique<MemoryLazyFrame>(std::move(result));
}

std::unique_ptr<core::ILazyFrame> MemoryLazyFrame::groupBySum(const std::vector<std::string> &keys) const {
	const Frame &source = *frame_;

	std::vector<std::size_t> key_indices;
	key_indices.reserve(keys.size());
	for (const auto &key : keys) {
		key_indices.push_back(requireColumn(source, key));
	}

	std::vector<std::size_t> value_indices;
	for (std::size_t index = 0; index < source.columnCount(); ++index) {
		if (std::find(key_indices.begin(), key_indices.end(), index) != key_indices.end()) {
			continue;
		}
		const auto &column = source.column(index);
		if (!column.isNumeric()) {
			throw core::ColumnTypeError("Column '" + column.name() + "' of type " +
			                            core::toString(column.type()) + " cannot be summed.");
		}
		value_indices.push_back(index);
	}

	// Groups are numbered in order of first appearance.
	std::map<std::vector<Column::Cell>, std::size_t> group_lookup;
	std::vector<std::vector<Column::Cell>> group_keys;
	std::vector<std::vector<double>> sums(value_indices.size());

	for (std::size_t row = 0; row < source.rows(); ++row) {
		std::vector<Column::Cell> key;
		key.reserve(key_indices.size());
		for (const auto index : key_indices) {
			key.push_back(source.column(index).cell(row));
		}

		const auto inserted = group_lookup.emplace(key, group_keys.size());
		if (inserted.second) {
			group_keys.push_back(std::move(key));
			for (auto &sum : sums) {
				sum.push_back(0.0);
			}
		}
		const auto group = inserted.first->second;

		for (std::size_t v = 0; v < value_indices.size(); ++v) {
			const auto &column = source.column(value_indices[v]);
			if (!column.isNull(row)) {
				sums[v][group] += column.asDouble(row);
			}
		}
	}

	Frame result;
	for (std::size_t k = 0; k < key_indices.size(); ++k) {
		const auto &key_column = source.column(key_indices[k]);
		std::vector<Column::Cell> cells;
		cells.reserve(group_keys.size());
		for (const auto &group_key : group_keys) {
			cells.push_back(group_key[k]);
		}
		result.addColumn(Column(key_column.name(), key_column.type(), std::move(cells)));
	}
	for (std::size_t v = 0; v < value_indices.size(); ++v) {
		std::vector<Column::Cell> cells(sums[v].begin(), sums[v].end());
		result.addColumn(Column(source.column(value_indices[v]).name(), core::DataType::Float64, std::move(cells)));
	}
	return std::make_unique<MemoryLazyFrame>(std::move(result));
}

std::unique_ptr<core::ILazyFrame> MemoryLazyFrame::sort(const std::vector<std::string> &keys) const {
	const Frame &source = *frame_;

	std::vector<const Column *> key_columns;
	key_columns.reserve(keys.size());
	for (const auto &key : keys) {
		key_columns.push_back(&source.column(requireColumn(source, key)));
	}

	std::vector<std::size_t> order(source.rows());
	std::iota(order.begin(), order.end(), 0);
	// Null cells (std::monostate) order before any value.
	std::stable_sort(order.begin(), order.end(), [&key_columns](std::size_t a, std::size_t b) {
		for (const auto *column : key_columns) {
			const auto &lhs = column->cell(a);
			const auto &rhs = column->cell(b);
			if (lhs < rhs) {
				return true;
			}
			if (rhs < lhs) {
				return false;
			}
		}
		return false;
	});

	Frame result;
	for (const auto &column : source.columns()) {
		std::vector<Column::Cell> cells;
		cells.reserve(order.size());
		for (const auto row : order) {
			cells.push_back(column.cell(row));
		}
		result.addColumn(Column(column.name(), column.type(), std::move(cells)));
	}
	return std::make_unique<MemoryLazyFrame>(std::move(result));
}

} // namespace fcstaccuracy::backends

namespace fcstaccuracy::core {

std::unique_ptr<ILazyFrame> FrameAdapter<Frame>::fromNative(const Frame &frame) {
	return backends::MemoryLazyFrame::borrow(frame);
}

Frame FrameAdapter<Frame>::toNative(const ILazyFrame &frame) {
	const auto *memory = dynamic_cast<const backends::MemoryLazyFrame *>(&frame);
	if (memory == nullptr) {
		throw AdaptationError("Cannot convert a '" + frame.backendName() + "' frame to an in-memory Frame.");
	}
	return memory->frame();
}

} // namespace fcstaccuracy::core
