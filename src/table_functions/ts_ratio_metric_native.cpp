#include "ts_ratio_metric_native.hpp"
#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/types/date.hpp"
#include "duckdb/common/types/timestamp.hpp"

#include "fcst-accuracy/backends/memory_frame.hpp"
#include "fcst-accuracy/metrics/ratio_metric.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace duckdb {

using FrameColumn = fcstaccuracy::core::Column;
using fcstaccuracy::metrics::RatioMetricKind;

// ============================================================================
// _ts_ratio_metric_native - grouped WAPE / BIAS over several model columns
//
// This function takes:
// - Input table with ALL columns
// - models: VARCHAR[] of prediction column names
// - id_col, target_col, cutoff_col: column roles
// - metric: 'wape' or 'bias'
//
// Output: group columns ([cutoff_col, id_col] when the input has cutoff_col,
// else [id_col]) followed by one DOUBLE column per model, sorted by the group
// columns.
// ============================================================================

static RatioMetricKind ParseRatioMetric(const string &metric_str) {
    string lower = StringUtil::Lower(metric_str);
    if (lower == "wape") return RatioMetricKind::Wape;
    if (lower == "bias") return RatioMetricKind::Bias;
    throw InvalidInputException("Unknown ratio metric: %s. Supported: wape, bias", metric_str);
}

namespace ts_ratio_metric_internal {

KeyKind ClassifyKeyType(const LogicalType &type, const string &column_name) {
    switch (type.id()) {
        case LogicalTypeId::VARCHAR:
            return KeyKind::VARCHAR;
        case LogicalTypeId::TINYINT:
        case LogicalTypeId::SMALLINT:
        case LogicalTypeId::INTEGER:
        case LogicalTypeId::BIGINT:
        case LogicalTypeId::UTINYINT:
        case LogicalTypeId::USMALLINT:
        case LogicalTypeId::UINTEGER:
            return KeyKind::INTEGRAL;
        case LogicalTypeId::DATE:
            return KeyKind::DATE;
        case LogicalTypeId::TIMESTAMP:
        case LogicalTypeId::TIMESTAMP_TZ:
            return KeyKind::TIMESTAMP;
        default:
            throw InvalidInputException("Unsupported type %s for group column '%s'. "
                                        "Supported: VARCHAR, integer types, DATE, TIMESTAMP, TIMESTAMPTZ",
                                        type.ToString(), column_name);
    }
}

fcstaccuracy::core::DataType KeyDataType(KeyKind kind) {
    return kind == KeyKind::VARCHAR ? fcstaccuracy::core::DataType::Utf8 : fcstaccuracy::core::DataType::Int64;
}

FrameColumn::Cell KeyValueToCell(const Value &value, KeyKind kind) {
    if (value.IsNull()) {
        return FrameColumn::Cell(std::monostate {});
    }
    switch (kind) {
        case KeyKind::VARCHAR:
            return FrameColumn::Cell(value.GetValue<string>());
        case KeyKind::INTEGRAL:
            return FrameColumn::Cell(value.GetValue<int64_t>());
        case KeyKind::DATE:
            return FrameColumn::Cell(static_cast<int64_t>(value.GetValue<date_t>().days));
        case KeyKind::TIMESTAMP:
            // TIMESTAMP and TIMESTAMPTZ share the microsecond representation
            return FrameColumn::Cell(static_cast<int64_t>(value.GetValueUnsafe<timestamp_t>().value));
    }
    return FrameColumn::Cell(std::monostate {});
}

Value CellToKeyValue(const FrameColumn::Cell &cell, KeyKind kind, const LogicalType &type) {
    if (std::holds_alternative<std::monostate>(cell)) {
        return Value(type);
    }
    switch (kind) {
        case KeyKind::VARCHAR:
            return Value(std::get<std::string>(cell));
        case KeyKind::INTEGRAL:
            return Value::BIGINT(std::get<int64_t>(cell)).DefaultCastAs(type);
        case KeyKind::DATE:
            return Value::DATE(date_t(static_cast<int32_t>(std::get<int64_t>(cell))));
        case KeyKind::TIMESTAMP:
            if (type.id() == LogicalTypeId::TIMESTAMP_TZ) {
                return Value::TIMESTAMPTZ(timestamp_tz_t(std::get<int64_t>(cell)));
            }
            return Value::TIMESTAMP(timestamp_t(std::get<int64_t>(cell)));
    }
    return Value(type);
}

} // namespace ts_ratio_metric_internal

using namespace ts_ratio_metric_internal;

// ============================================================================
// Bind Data
// ============================================================================

struct TsRatioMetricNativeBindData : public TableFunctionData {
    RatioMetricKind metric = RatioMetricKind::Wape;
    fcstaccuracy::metrics::RatioMetricOptions options;
    vector<string> models;

    // Group columns in output order, with their input indices and types
    vector<string> group_cols;
    vector<idx_t> group_col_indices;
    vector<LogicalType> group_col_types;
    vector<KeyKind> group_key_kinds;

    idx_t target_col_idx = 0;
    vector<idx_t> model_col_indices;
};

// ============================================================================
// Global State
// ============================================================================

struct TsRatioMetricNativeGlobalState : public GlobalTableFunctionState {
    idx_t MaxThreads() const override {
        return 999999;
    }

    std::mutex rows_mutex;
    vector<std::vector<FrameColumn::Cell>> key_cells;
    std::vector<std::optional<double>> targets;
    vector<std::vector<std::optional<double>>> predictions;

    fcstaccuracy::core::Frame result;
    bool processed = false;
    idx_t output_offset = 0;
    std::atomic<bool> finalize_claimed{false};
    std::atomic<idx_t> threads_collecting{0};
    std::atomic<idx_t> threads_done_collecting{0};
};

// ============================================================================
// Local State
// ============================================================================

struct TsRatioMetricNativeLocalState : public LocalTableFunctionState {
    bool owns_finalize = false;
    bool registered_collector = false;
    bool registered_finalizer = false;
};

// ============================================================================
// Bind Function
// ============================================================================

static string RequireStringParameter(const Value &value, const char *parameter) {
    if (value.IsNull()) {
        throw InvalidInputException("_ts_ratio_metric_native: %s must not be NULL", parameter);
    }
    return value.GetValue<string>();
}

static idx_t FindColumn(const vector<string> &col_names, const string &name) {
    for (idx_t i = 0; i < col_names.size(); i++) {
        if (col_names[i] == name) {
            return i;
        }
    }
    throw InvalidInputException("Column '%s' not found in input table", name);
}

static unique_ptr<FunctionData> TsRatioMetricNativeBind(
    ClientContext &context,
    TableFunctionBindInput &input,
    vector<LogicalType> &return_types,
    vector<string> &names) {

    auto bind_data = make_uniq<TsRatioMetricNativeBindData>();

    // TABLE is at index 0, so non-table params start at index 1
    if (input.inputs.size() < 6) {
        throw InvalidInputException(
            "_ts_ratio_metric_native requires: (input_table, models, id_col, target_col, cutoff_col, metric)");
    }

    if (input.inputs[1].IsNull()) {
        throw InvalidInputException("_ts_ratio_metric_native: models must not be NULL");
    }
    for (auto &model_val : ListValue::GetChildren(input.inputs[1])) {
        if (model_val.IsNull()) {
            throw InvalidInputException("_ts_ratio_metric_native: model names must not be NULL");
        }
        bind_data->models.push_back(model_val.GetValue<string>());
    }

    bind_data->options.id_col = RequireStringParameter(input.inputs[2], "id_col");
    bind_data->options.target_col = RequireStringParameter(input.inputs[3], "target_col");
    bind_data->options.cutoff_col = RequireStringParameter(input.inputs[4], "cutoff_col");
    bind_data->metric = ParseRatioMetric(RequireStringParameter(input.inputs[5], "metric"));

    auto &col_names = input.input_table_names;
    auto &col_types = input.input_table_types;

    auto &options = bind_data->options;
    if (options.target_col == options.id_col) {
        throw InvalidInputException("Target column '%s' cannot also be the id column", options.target_col);
    }

    // Group key derives from the input schema
    auto group_cols = fcstaccuracy::metrics::resolveGroupColumns(
        col_names, bind_data->options.id_col, bind_data->options.cutoff_col);
    bind_data->group_cols.assign(group_cols.begin(), group_cols.end());
    if (bind_data->group_cols.size() > 1 && (options.cutoff_col == options.id_col || options.cutoff_col == options.target_col)) {
        throw InvalidInputException("Cutoff column '%s' cannot also be the id or target column", options.cutoff_col);
    }
    for (auto &group_col : bind_data->group_cols) {
        idx_t idx = FindColumn(col_names, group_col);
        bind_data->group_col_indices.push_back(idx);
        bind_data->group_col_types.push_back(col_types[idx]);
        bind_data->group_key_kinds.push_back(ClassifyKeyType(col_types[idx], group_col));
    }

    bind_data->target_col_idx = FindColumn(col_names, bind_data->options.target_col);
    if (!col_types[bind_data->target_col_idx].IsNumeric()) {
        throw InvalidInputException("Target column '%s' must be numeric, got %s",
                                    bind_data->options.target_col, col_types[bind_data->target_col_idx].ToString());
    }

    std::set<string> seen;
    for (auto &model : bind_data->models) {
        idx_t idx = FindColumn(col_names, model);
        if (!col_types[idx].IsNumeric()) {
            throw InvalidInputException("Model column '%s' must be numeric, got %s", model, col_types[idx].ToString());
        }
        if (model == bind_data->options.target_col ||
            std::find(bind_data->group_cols.begin(), bind_data->group_cols.end(), model) != bind_data->group_cols.end()) {
            throw InvalidInputException("Model column '%s' cannot also be the target or a group column", model);
        }
        if (!seen.insert(model).second) {
            throw InvalidInputException("Model column '%s' is listed more than once", model);
        }
        bind_data->model_col_indices.push_back(idx);
    }

    // Output schema: group columns (input types preserved), then one DOUBLE per model
    for (idx_t k = 0; k < bind_data->group_cols.size(); k++) {
        names.push_back(bind_data->group_cols[k]);
        return_types.push_back(bind_data->group_col_types[k]);
    }
    for (auto &model : bind_data->models) {
        names.push_back(model);
        return_types.push_back(LogicalType::DOUBLE);
    }

    return bind_data;
}

// ============================================================================
// Init Functions
// ============================================================================

static unique_ptr<GlobalTableFunctionState> TsRatioMetricNativeInitGlobal(
    ClientContext &context,
    TableFunctionInitInput &input) {
    auto &bind_data = input.bind_data->Cast<TsRatioMetricNativeBindData>();
    auto gstate = make_uniq<TsRatioMetricNativeGlobalState>();
    gstate->key_cells.resize(bind_data.group_cols.size());
    gstate->predictions.resize(bind_data.models.size());
    return gstate;
}

static unique_ptr<LocalTableFunctionState> TsRatioMetricNativeInitLocal(
    ExecutionContext &context,
    TableFunctionInitInput &input,
    GlobalTableFunctionState *global_state) {
    auto lstate = make_uniq<TsRatioMetricNativeLocalState>();
    // Count every local state up front: a thread can hold input the others
    // have not seen yet before its first in-out call
    auto &gstate = global_state->Cast<TsRatioMetricNativeGlobalState>();
    gstate.threads_collecting.fetch_add(1);
    lstate->registered_collector = true;
    return std::move(lstate);
}

// ============================================================================
// In-Out Function (Buffer Input)
// ============================================================================

static std::optional<double> NumericValue(const Value &value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<double>();
}

static OperatorResultType TsRatioMetricNativeInOut(
    ExecutionContext &context,
    TableFunctionInput &data_p,
    DataChunk &input,
    DataChunk &output) {

    auto &bind_data = data_p.bind_data->Cast<TsRatioMetricNativeBindData>();
    auto &gstate = data_p.global_state->Cast<TsRatioMetricNativeGlobalState>();

    // Extract batch locally first (no lock)
    const idx_t n_keys = bind_data.group_cols.size();
    const idx_t n_models = bind_data.models.size();
    vector<std::vector<FrameColumn::Cell>> keys(n_keys);
    std::vector<std::optional<double>> targets;
    vector<std::vector<std::optional<double>>> predictions(n_models);
    targets.reserve(input.size());

    for (idx_t i = 0; i < input.size(); i++) {
        for (idx_t k = 0; k < n_keys; k++) {
            keys[k].push_back(
                KeyValueToCell(input.data[bind_data.group_col_indices[k]].GetValue(i), bind_data.group_key_kinds[k]));
        }
        targets.push_back(NumericValue(input.data[bind_data.target_col_idx].GetValue(i)));
        for (idx_t m = 0; m < n_models; m++) {
            predictions[m].push_back(NumericValue(input.data[bind_data.model_col_indices[m]].GetValue(i)));
        }
    }

    // Lock once and append all
    {
        std::lock_guard<std::mutex> lock(gstate.rows_mutex);
        for (idx_t k = 0; k < n_keys; k++) {
            auto &dest = gstate.key_cells[k];
            dest.insert(dest.end(), std::make_move_iterator(keys[k].begin()), std::make_move_iterator(keys[k].end()));
        }
        gstate.targets.insert(gstate.targets.end(), targets.begin(), targets.end());
        for (idx_t m = 0; m < n_models; m++) {
            auto &dest = gstate.predictions[m];
            dest.insert(dest.end(), predictions[m].begin(), predictions[m].end());
        }
    }

    output.SetCardinality(0);
    return OperatorResultType::NEED_MORE_INPUT;
}

// ============================================================================
// Finalize Function (Process and Output)
// ============================================================================

static fcstaccuracy::core::Frame BuildInputFrame(const TsRatioMetricNativeBindData &bind_data,
                                                 TsRatioMetricNativeGlobalState &gstate) {
    std::lock_guard<std::mutex> lock(gstate.rows_mutex);
    fcstaccuracy::core::Frame frame;
    for (idx_t k = 0; k < bind_data.group_cols.size(); k++) {
        frame.addColumn(FrameColumn(bind_data.group_cols[k], KeyDataType(bind_data.group_key_kinds[k]),
                               std::move(gstate.key_cells[k])));
    }
    frame.addColumn(FrameColumn::float64(bind_data.options.target_col, gstate.targets));
    for (idx_t m = 0; m < bind_data.models.size(); m++) {
        frame.addColumn(FrameColumn::float64(bind_data.models[m], gstate.predictions[m]));
    }
    return frame;
}

static OperatorFinalizeResultType TsRatioMetricNativeFinalize(
    ExecutionContext &context,
    TableFunctionInput &data_p,
    DataChunk &output) {

    auto &bind_data = data_p.bind_data->Cast<TsRatioMetricNativeBindData>();
    auto &gstate = data_p.global_state->Cast<TsRatioMetricNativeGlobalState>();
    auto &lstate = data_p.local_state->Cast<TsRatioMetricNativeLocalState>();

    // Barrier + claim pattern
    if (!lstate.registered_finalizer) {
        if (lstate.registered_collector)
            gstate.threads_done_collecting.fetch_add(1);
        lstate.registered_finalizer = true;
    }

    if (!lstate.owns_finalize) {
        bool expected = false;
        if (!gstate.finalize_claimed.compare_exchange_strong(expected, true))
            return OperatorFinalizeResultType::FINISHED;
        lstate.owns_finalize = true;
        while (gstate.threads_done_collecting.load() < gstate.threads_collecting.load())
            std::this_thread::yield();
    }

    // Run the engine once on the buffered rows
    if (!gstate.processed) {
        fcstaccuracy::metrics::RatioMetricEngine engine(bind_data.metric);
        try {
            auto frame = BuildInputFrame(bind_data, gstate);
            gstate.result = engine.compute(frame, bind_data.models, bind_data.options);
        } catch (const std::invalid_argument &e) {
            throw InvalidInputException(e.what());
        }
        gstate.processed = true;
    }

    // Stream results
    idx_t remaining = gstate.result.rows() - gstate.output_offset;
    if (remaining == 0) {
        output.SetCardinality(0);
        return OperatorFinalizeResultType::FINISHED;
    }

    idx_t to_output = std::min(remaining, static_cast<idx_t>(STANDARD_VECTOR_SIZE));
    output.SetCardinality(to_output);

    for (idx_t col = 0; col < output.ColumnCount(); col++) {
        output.data[col].SetVectorType(VectorType::FLAT_VECTOR);
    }

    const idx_t n_keys = bind_data.group_cols.size();
    for (idx_t i = 0; i < to_output; i++) {
        const idx_t row = gstate.output_offset + i;

        // Output group columns
        for (idx_t k = 0; k < n_keys; k++) {
            output.data[k].SetValue(i, CellToKeyValue(gstate.result.column(k).cell(row),
                                                      bind_data.group_key_kinds[k], bind_data.group_col_types[k]));
        }

        // Output metric values
        for (idx_t m = 0; m < bind_data.models.size(); m++) {
            auto metric = gstate.result.column(n_keys + m).optionalDouble(row);
            output.data[n_keys + m].SetValue(i, metric ? Value::DOUBLE(*metric) : Value(LogicalType::DOUBLE));
        }
    }

    gstate.output_offset += to_output;

    if (gstate.output_offset >= gstate.result.rows()) {
        return OperatorFinalizeResultType::FINISHED;
    }
    return OperatorFinalizeResultType::HAVE_MORE_OUTPUT;
}

// ============================================================================
// Registration
// ============================================================================

void RegisterTsRatioMetricNativeFunction(ExtensionLoader &loader) {
    TableFunction func(
        "_ts_ratio_metric_native",
        {LogicalType::TABLE,                      // Input table
         LogicalType::LIST(LogicalType::VARCHAR), // models
         LogicalType::VARCHAR,                    // id_col
         LogicalType::VARCHAR,                    // target_col
         LogicalType::VARCHAR,                    // cutoff_col
         LogicalType::VARCHAR},                   // metric
        nullptr,
        TsRatioMetricNativeBind,
        TsRatioMetricNativeInitGlobal,
        TsRatioMetricNativeInitLocal);

    func.in_out_function = TsRatioMetricNativeInOut;
    func.in_out_function_final = TsRatioMetricNativeFinalize;

    loader.RegisterFunction(func);
}

} // namespace duckdb
