#pragma once

#include "fcst-accuracy/core/expression.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace fcstaccuracy::core {

/**
 * @class ILazyFrame
 * @brief The tabular capabilities the metric engine needs from a backend.
 *
 * Implementations wrap one concrete tabular engine. Every operation returns a
 * new frame and leaves the receiver untouched, so a frame may be shared
 * between concurrent readers.
 */
class ILazyFrame {
public:
	virtual ~ILazyFrame() = default;

	/**
	 * @brief Column names in schema order.
	 */
	virtual std::vector<std::string> columns() const = 0;

	/**
	 * @brief Projects the frame onto the given expressions.
	 *
	 * Each expression becomes one output column named by Expr::outputName().
	 * Derived expressions must carry an alias.
	 */
	virtual std::unique_ptr<ILazyFrame> select(const std::vector<Expr> &exprs) const = 0;

	/**
	 * @brief Groups rows by the key columns and sums every other column.
	 *
	 * Undefined cells contribute nothing to a sum; a group whose cells are all
	 * undefined sums to zero. Key columns come first in the output.
	 */
	virtual std::unique_ptr<ILazyFrame> groupBySum(const std::vector<std::string> &keys) const = 0;

	/**
	 * @brief Sorts rows ascending by the key columns, lexicographically.
	 */
	virtual std::unique_ptr<ILazyFrame> sort(const std::vector<std::string> &keys) const = 0;

	/**
	 * @brief Gets the name of the backing engine (e.g., "memory", "duckdb").
	 */
	virtual std::string backendName() const = 0;

	bool hasColumn(const std::string &name) const {
		const auto names = columns();
		return std::find(names.begin(), names.end(), name) != names.end();
	}
};

namespace detail {
template <typename T>
struct always_false : std::false_type {};
} // namespace detail

/**
 * @brief Maps a native tabular type onto an ILazyFrame and back.
 *
 * Backends specialize this template for the type they wrap:
 *
 *   static std::unique_ptr<ILazyFrame> fromNative(const Native &native);
 *   static Native toNative(const ILazyFrame &frame);
 *
 * toNative throws AdaptationError when handed a frame of another backend.
 */
template <typename Native, typename Enable = void>
struct FrameAdapter {
	static_assert(detail::always_false<Native>::value,
	              "No FrameAdapter specialization for this tabular type. Include the backend header that adapts it.");
};

template <typename Native>
std::unique_ptr<ILazyFrame> fromNative(const Native &native) {
	return FrameAdapter<Native>::fromNative(native);
}

template <typename Native>
Native toNative(const ILazyFrame &frame) {
	return FrameAdapter<Native>::toNative(frame);
}

} // namespace fcstaccuracy::core
