#include "fcst_accuracy_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/parser/parser.hpp"
#include "duckdb/parser/parsed_data/create_macro_info.hpp"
#include "duckdb/parser/statement/select_statement.hpp"
#include "duckdb/parser/expression/columnref_expression.hpp"
#include "duckdb/function/table_macro_function.hpp"

namespace duckdb {

// Structure for defining table macros
struct TsTableMacro {
    const char *name;
    const char *parameters[8];          // Positional parameters (nullptr terminated)
    struct {
        const char *name;
        const char *default_value;
    } named_params[8];                  // Named parameters with defaults
    const char *macro;                  // SQL definition
};

// clang-format off
static const TsTableMacro ts_table_macros[] = {
    // ts_wape: Weighted Absolute Percentage Error per series (and cutoff)
    // C++ API: ts_wape(source, models, id_col := 'unique_id', target_col := 'y', cutoff_col := 'cutoff')
    {"ts_wape", {"source", "models", nullptr},
     {{"id_col", "'unique_id'"}, {"target_col", "'y'"}, {"cutoff_col", "'cutoff'"}, {nullptr, nullptr}},
R"(
SELECT * FROM _ts_ratio_metric_native(
    (SELECT * FROM query_table(source::VARCHAR)),
    models,
    id_col,
    target_col,
    cutoff_col,
    'wape'
)
)"},

    // ts_bias: Relative bias per series (and cutoff), positive when under-forecasting
    // C++ API: ts_bias(source, models, id_col := 'unique_id', target_col := 'y', cutoff_col := 'cutoff')
    {"ts_bias", {"source", "models", nullptr},
     {{"id_col", "'unique_id'"}, {"target_col", "'y'"}, {"cutoff_col", "'cutoff'"}, {nullptr, nullptr}},
R"(
SELECT * FROM _ts_ratio_metric_native(
    (SELECT * FROM query_table(source::VARCHAR)),
    models,
    id_col,
    target_col,
    cutoff_col,
    'bias'
)
)"},

    // Sentinel
    {nullptr, {nullptr}, {{nullptr, nullptr}}, nullptr}
};
// clang-format on

static unique_ptr<CreateMacroInfo> CreateTableMacro(const TsTableMacro &macro_def) {
    Parser parser;
    parser.ParseQuery(macro_def.macro);
    if (parser.statements.size() != 1 || parser.statements[0]->type != StatementType::SELECT_STATEMENT) {
        throw InternalException("Expected a single select statement in CreateTableMacro");
    }
    auto node = std::move(parser.statements[0]->Cast<SelectStatement>().node);

    auto function = make_uniq<TableMacroFunction>(std::move(node));

    for (idx_t i = 0; macro_def.parameters[i] != nullptr; i++) {
        function->parameters.push_back(make_uniq<ColumnRefExpression>(macro_def.parameters[i]));
    }

    // Named parameters carry their default expression
    for (idx_t i = 0; macro_def.named_params[i].name != nullptr; i++) {
        const auto &param = macro_def.named_params[i];
        function->parameters.push_back(make_uniq<ColumnRefExpression>(param.name));

        auto expr_list = Parser::ParseExpressionList(param.default_value);
        if (!expr_list.empty()) {
            function->default_parameters.insert(make_pair(string(param.name), std::move(expr_list[0])));
        }
    }

    auto info = make_uniq<CreateMacroInfo>(CatalogType::TABLE_MACRO_ENTRY);
    info->schema = DEFAULT_SCHEMA;
    info->name = macro_def.name;
    info->temporary = true;
    info->internal = true;
    info->macros.push_back(std::move(function));

    return info;
}

void RegisterTsTableMacros(ExtensionLoader &loader) {
    for (idx_t i = 0; ts_table_macros[i].name != nullptr; i++) {
        auto info = CreateTableMacro(ts_table_macros[i]);
        loader.RegisterFunction(*info);
    }
}

} // namespace duckdb
