#include "fcst-accuracy/metrics/ratio_metric.hpp"
#include "fcst-accuracy/core/errors.hpp"
#include "fcst-accuracy/utils/logging.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace fcstaccuracy::metrics {

using core::Expr;

namespace {

std::string numeratorName(std::size_t index) {
	return "__metric_" + std::to_string(index) + "_num";
}

std::string denominatorName(std::size_t index) {
	return "__metric_" + std::to_string(index) + "_den";
}

[[maybe_unused]] std::string joinNames(const std::vector<std::string> &names) {
	std::string joined;
	for (std::size_t i = 0; i < names.size(); ++i) {
		if (i > 0) {
			joined += ", ";
		}
		joined += names[i];
	}
	return joined;
}

} // namespace

RatioMetricEngine::RatioMetricEngine(RatioMetricKind kind, std::shared_ptr<const IMetricHelpers> helpers)
    : kind_(kind), helpers_(std::move(helpers)) {
	if (!helpers_) {
		throw std::invalid_argument("RatioMetricEngine requires metric helpers.");
	}
}

std::string RatioMetricEngine::getName() const {
	return kind_ == RatioMetricKind::Wape ? "WAPE" : "BIAS";
}

void RatioMetricEngine::validateSchema(const std::vector<std::string> &columns, const std::vector<std::string> &models,
                                       const RatioMetricOptions &options) const {
	const auto require = [&columns](const std::string &name) {
		if (std::find(columns.begin(), columns.end(), name) == columns.end()) {
			throw core::ColumnNotFoundError(name);
		}
	};

	require(options.id_col);
	require(options.target_col);
	if (options.target_col == options.id_col) {
		throw std::invalid_argument("Target column '" + options.target_col + "' cannot also be the id column.");
	}

	std::set<std::string> seen;
	for (const auto &model : models) {
		require(model);
		if (!seen.insert(model).second) {
			throw std::invalid_argument("Model column '" + model + "' is listed more than once.");
		}
	}
}

Expr RatioMetricEngine::errorExpression(const std::string &target_col, const std::string &model) const {
	Expr error = core::col(target_col) - core::col(model);
	if (absoluteError()) {
		error = error.abs();
	}
	return error;
}

std::unique_ptr<core::ILazyFrame> RatioMetricEngine::evaluate(const core::ILazyFrame &frame,
                                                              const std::vector<std::string> &models,
                                                              const RatioMetricOptions &options) const {
	const auto columns = frame.columns();
	validateSchema(columns, models, options);

	const auto group_cols = helpers_->groupColumns(columns, options.id_col, options.cutoff_col);
	std::set<std::string> distinct_groups;
	for (const auto &group_col : group_cols) {
		if (group_col == options.target_col || !distinct_groups.insert(group_col).second) {
			throw std::invalid_argument("Group column '" + group_col +
			                            "' cannot also be the target or another group column.");
		}
	}
	for (const auto &model : models) {
		if (model == options.target_col || std::find(group_cols.begin(), group_cols.end(), model) != group_cols.end()) {
			throw std::invalid_argument("Model column '" + model + "' cannot also be the target or a group column.");
		}
	}
	if (models.empty()) {
		FCSTACC_WARN("{}: no model columns given, result holds group columns only.", getName());
	}
	FCSTACC_DEBUG("{}: scoring {} model(s) on the {} backend, grouped by [{}].", getName(), models.size(),
	              frame.backendName(), joinNames(group_cols));

	// Masked numerator and denominator per model; a null prediction removes the
	// row from both sums of that model only.
	std::vector<Expr> masked;
	masked.reserve(group_cols.size() + 2 * models.size());
	for (const auto &group_col : group_cols) {
		masked.push_back(core::col(group_col));
	}
	for (std::size_t i = 0; i < models.size(); ++i) {
		const auto has_prediction = !core::col(models[i]).isNull();
		masked.push_back(core::when(has_prediction)
		                     .then(errorExpression(options.target_col, models[i]))
		                     .otherwise(core::undefined())
		                     .alias(numeratorName(i)));
		masked.push_back(core::when(has_prediction)
		                     .then(core::col(options.target_col))
		                     .otherwise(core::undefined())
		                     .alias(denominatorName(i)));
	}

	const auto aggregated = frame.select(masked)->groupBySum(group_cols);

	std::vector<Expr> ratios;
	ratios.reserve(group_cols.size() + models.size());
	for (const auto &group_col : group_cols) {
		ratios.push_back(core::col(group_col));
	}
	for (std::size_t i = 0; i < models.size(); ++i) {
		const Expr denominator = helpers_->zeroToUndefined(core::col(denominatorName(i)));
		ratios.push_back((core::col(numeratorName(i)) / denominator).alias(models[i]));
	}

	return aggregated->select(ratios)->sort(group_cols);
}

} // namespace fcstaccuracy::metrics
