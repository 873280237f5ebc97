#pragma once

#include "fcst-accuracy/core/frame.hpp"
#include "fcst-accuracy/core/lazy_frame.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace fcstaccuracy::backends {

using ValidityMask = Eigen::Array<bool, Eigen::Dynamic, 1>;

/**
 * @struct NumericArray
 * @brief Result of evaluating a numeric expression over every row of a frame.
 *
 * `valid(i) == false` marks row i as undefined; its value is unspecified.
 */
struct NumericArray {
	Eigen::ArrayXd values;
	ValidityMask valid;
};

/**
 * @brief Evaluates an expression to a numeric array.
 *
 * Comparisons and boolean operators yield 1.0 / 0.0. Division by zero yields
 * undefined, as does any arithmetic involving an undefined operand.
 * @throws core::ColumnNotFoundError If a referenced column does not exist.
 * @throws core::ColumnTypeError If a referenced column is not numeric.
 */
NumericArray evaluateNumeric(const core::Frame &frame, const core::Expr &expr);

/**
 * @brief Evaluates an expression to an output column named by Expr::outputName().
 *
 * Bare column references are passed through with their original type; any
 * other expression produces a Float64 column.
 */
core::Column evaluateColumn(const core::Frame &frame, const core::Expr &expr);

/**
 * @class MemoryLazyFrame
 * @brief ILazyFrame over an in-memory core::Frame.
 */
class MemoryLazyFrame final : public core::ILazyFrame {
public:
	explicit MemoryLazyFrame(core::Frame frame);

	/**
	 * @brief Wraps a frame without copying it. The frame must outlive this object.
	 */
	static std::unique_ptr<MemoryLazyFrame> borrow(const core::Frame &frame);

	std::vector<std::string> columns() const override;
	std::unique_ptr<core::ILazyFrame> select(const std::vector<core::Expr> &exprs) const override;
	std::unique_ptr<core::ILazyFrame> groupBySum(const std::vector<std::string> &keys) const override;
	std::unique_ptr<core::ILazyFrame> sort(const std::vector<std::string> &keys) const override;
	std::string backendName() const override {
		return "memory";
	}

	const core::Frame &frame() const {
		return *frame_;
	}

private:
	explicit MemoryLazyFrame(std::shared_ptr<const core::Frame> frame);

	std::shared_ptr<const core::Frame> frame_;
};

} // namespace fcstaccuracy::backends

namespace fcstaccuracy::core {

template <>
struct FrameAdapter<Frame> {
	/// Borrows the frame for the lifetime of the returned lazy frame.
	static std::unique_ptr<ILazyFrame> fromNative(const Frame &frame);
	static Frame toNative(const ILazyFrame &frame);
};

} // namespace fcstaccuracy::core
