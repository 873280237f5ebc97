#include "fcst-accuracy/core/frame.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace fcstaccuracy::core {

namespace {

bool cellMatches(const Column::Cell &cell, DataType type) {
	if (std::holds_alternative<std::monostate>(cell)) {
		return true;
	}
	switch (type) {
	case DataType::Int64:
		return std::holds_alternative<std::int64_t>(cell);
	case DataType::Float64:
		return std::holds_alternative<double>(cell);
	case DataType::Utf8:
		return std::holds_alternative<std::string>(cell);
	}
	return false;
}

template <typename T>
std::vector<Column::Cell> toCells(const std::vector<std::optional<T>> &values) {
	std::vector<Column::Cell> cells;
	cells.reserve(values.size());
	for (const auto &value : values) {
		if (value) {
			cells.emplace_back(*value);
		} else {
			cells.emplace_back(std::monostate{});
		}
	}
	return cells;
}

} // namespace

std::string toString(DataType type) {
	switch (type) {
	case DataType::Int64:
		return "Int64";
	case DataType::Float64:
		return "Float64";
	case DataType::Utf8:
		return "Utf8";
	}
	return "Unknown";
}

// --- Column ---

Column::Column(std::string name, DataType type, std::vector<Cell> cells)
    : name_(std::move(name)), type_(type), cells_(std::move(cells)) {
	if (name_.empty()) {
		throw std::invalid_argument("Column name must not be empty.");
	}
	for (std::size_t row = 0; row < cells_.size(); ++row) {
		if (!cellMatches(cells_[row], type_)) {
			throw std::invalid_argument("Cell " + std::to_string(row) + " of column '" + name_ +
			                            "' does not hold a " + toString(type_) + " value.");
		}
	}
}

Column Column::int64(std::string name, const std::vector<std::optional<std::int64_t>> &values) {
	return Column(std::move(name), DataType::Int64, toCells(values));
}

Column Column::float64(std::string name, const std::vector<std::optional<double>> &values) {
	return Column(std::move(name), DataType::Float64, toCells(values));
}

Column Column::utf8(std::string name, const std::vector<std::optional<std::string>> &values) {
	return Column(std::move(name), DataType::Utf8, toCells(values));
}

const Column::Cell &Column::cell(std::size_t row) const {
	if (row >= cells_.size()) {
		throw std::out_of_range("Row " + std::to_string(row) + " is out of range for column '" + name_ + "'.");
	}
	return cells_[row];
}

bool Column::isNull(std::size_t row) const {
	return std::holds_alternative<std::monostate>(cell(row));
}

double Column::asDouble(std::size_t row) const {
	if (!isNumeric()) {
		throw ColumnTypeError("Column '" + name_ + "' of type " + toString(type_) + " is not numeric.");
	}
	const auto &value = cell(row);
	if (const auto *as_int = std::get_if<std::int64_t>(&value)) {
		return static_cast<double>(*as_int);
	}
	if (const auto *as_double = std::get_if<double>(&value)) {
		return *as_double;
	}
	throw std::invalid_argument("Cell " + std::to_string(row) + " of column '" + name_ + "' is null.");
}

std::optional<double> Column::optionalDouble(std::size_t row) const {
	if (isNull(row)) {
		return std::nullopt;
	}
	return asDouble(row);
}

Column Column::renamed(std::string name) const {
	return Column(std::move(name), type_, cells_);
}

bool Column::operator==(const Column &other) const {
	return name_ == other.name_ && type_ == other.type_ && cells_ == other.cells_;
}

// --- Frame ---

Frame::Frame(std::vector<Column> columns) {
	columns_.reserve(columns.size());
	for (auto &column : columns) {
		addColumn(std::move(column));
	}
}

Frame &Frame::addColumn(Column column) {
	if (hasColumn(column.name())) {
		throw std::invalid_argument("Duplicate column name '" + column.name() + "'.");
	}
	if (!columns_.empty() && column.size() != rows_) {
		throw std::invalid_argument("Column '" + column.name() + "' has " + std::to_string(column.size()) +
		                            " rows, expected " + std::to_string(rows_) + ".");
	}
	rows_ = column.size();
	columns_.push_back(std::move(column));
	return *this;
}

bool Frame::hasColumn(const std::string &name) const {
	return columnIndex(name).has_value();
}

std::optional<std::size_t> Frame::columnIndex(const std::string &name) const {
	const auto it = std::find_if(columns_.begin(), columns_.end(),
	                             [&name](const Column &column) { return column.name() == name; });
	if (it == columns_.end()) {
		return std::nullopt;
	}
	return static_cast<std::size_t>(std::distance(columns_.begin(), it));
}

const Column &Frame::column(const std::string &name) const {
	const auto index = columnIndex(name);
	if (!index) {
		throw ColumnNotFoundError(name);
	}
	return columns_[*index];
}

const Column &Frame::column(std::size_t index) const {
	if (index >= columns_.size()) {
		throw std::out_of_range("Column index " + std::to_string(index) + " is out of range.");
	}
	return columns_[index];
}

std::vector<std::string> Frame::columnNames() const {
	std::vector<std::string> names;
	names.reserve(columns_.size());
	for (const auto &column : columns_) {
		names.push_back(column.name());
	}
	return names;
}

bool Frame::operator==(const Frame &other) const {
	return rows_ == other.rows_ && columns_ == other.columns_;
}

} // namespace fcstaccuracy::core
