#pragma once

#include "duckdb.hpp"
#include "fcst-accuracy/core/frame.hpp"

namespace duckdb {

namespace ts_ratio_metric_internal {

// How a group-key column is carried through the in-memory frame
enum class KeyKind {
    VARCHAR,
    INTEGRAL,
    DATE,
    TIMESTAMP
};

KeyKind ClassifyKeyType(const LogicalType &type, const string &column_name);
fcstaccuracy::core::DataType KeyDataType(KeyKind kind);
fcstaccuracy::core::Column::Cell KeyValueToCell(const Value &value, KeyKind kind);
Value CellToKeyValue(const fcstaccuracy::core::Column::Cell &cell, KeyKind kind, const LogicalType &type);

} // namespace ts_ratio_metric_internal

// Registration for _ts_ratio_metric_native (TABLE in-out function behind ts_wape / ts_bias)
void RegisterTsRatioMetricNativeFunction(ExtensionLoader &loader);

} // namespace duckdb
