#pragma once

#include "fcst-accuracy/core/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fcstaccuracy::core {

enum class DataType {
	Int64,
	Float64,
	Utf8
};

std::string toString(DataType type);

/**
 * @class Column
 * @brief A named, typed column of nullable cells.
 *
 * Every cell is either null (`std::monostate`) or holds a value of the
 * column's declared type. Int64 and Float64 columns are numeric.
 */
class Column {
public:
	using Cell = std::variant<std::monostate, std::int64_t, double, std::string>;

	/**
	 * @brief Constructs a column from raw cells.
	 * @throws std::invalid_argument If the name is empty or a cell does not match the type.
	 */
	Column(std::string name, DataType type, std::vector<Cell> cells);

	static Column int64(std::string name, const std::vector<std::optional<std::int64_t>> &values);
	static Column float64(std::string name, const std::vector<std::optional<double>> &values);
	static Column utf8(std::string name, const std::vector<std::optional<std::string>> &values);

	const std::string &name() const {
		return name_;
	}

	DataType type() const {
		return type_;
	}

	std::size_t size() const {
		return cells_.size();
	}

	bool isNumeric() const {
		return type_ != DataType::Utf8;
	}

	const std::vector<Cell> &cells() const {
		return cells_;
	}

	const Cell &cell(std::size_t row) const;
	bool isNull(std::size_t row) const;

	/**
	 * @brief Reads a numeric cell as double.
	 * @throws ColumnTypeError If the column is not numeric.
	 * @throws std::invalid_argument If the cell is null.
	 */
	double asDouble(std::size_t row) const;

	std::optional<double> optionalDouble(std::size_t row) const;

	Column renamed(std::string name) const;

	bool operator==(const Column &other) const;
	bool operator!=(const Column &other) const {
		return !(*this == other);
	}

private:
	std::string name_;
	DataType type_;
	std::vector<Cell> cells_;
};

/**
 * @class Frame
 * @brief An in-memory columnar table with unique column names and aligned rows.
 */
class Frame {
public:
	Frame() = default;
	explicit Frame(std::vector<Column> columns);

	/**
	 * @brief Appends a column.
	 * @throws std::invalid_argument On duplicate names or mismatched row counts.
	 */
	Frame &addColumn(Column column);

	bool hasColumn(const std::string &name) const;
	std::optional<std::size_t> columnIndex(const std::string &name) const;

	/**
	 * @brief Looks a column up by name.
	 * @throws ColumnNotFoundError If no column carries that name.
	 */
	const Column &column(const std::string &name) const;
	const Column &column(std::size_t index) const;

	const std::vector<Column> &columns() const {
		return columns_;
	}

	std::vector<std::string> columnNames() const;

	std::size_t rows() const {
		return rows_;
	}

	std::size_t columnCount() const {
		return columns_.size();
	}

	bool empty() const {
		return columns_.empty();
	}

	bool operator==(const Frame &other) const;
	bool operator!=(const Frame &other) const {
		return !(*this == other);
	}

private:
	std::vector<Column> columns_;
	std::size_t rows_ = 0;
};

} // namespace fcstaccuracy::core
