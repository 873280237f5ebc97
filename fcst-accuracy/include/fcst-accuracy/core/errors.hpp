#pragma once

#include <stdexcept>
#include <string>

namespace fcstaccuracy::core {

/**
 * @class ColumnNotFoundError
 * @brief Raised when a required column is absent from a dataset.
 */
class ColumnNotFoundError : public std::invalid_argument {
public:
	explicit ColumnNotFoundError(const std::string &column)
	    : std::invalid_argument("Column '" + column + "' not found in input data."), column_(column) {
	}

	const std::string &column() const noexcept {
		return column_;
	}

private:
	std::string column_;
};

/**
 * @class ColumnTypeError
 * @brief Raised when a column is used with an operation its type does not support.
 */
class ColumnTypeError : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

/**
 * @class AdaptationError
 * @brief Raised when a native tabular object cannot be adapted to a lazy frame.
 */
class AdaptationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace fcstaccuracy::core
