#pragma once

#include "fcst-accuracy/core/expression.hpp"
#include "fcst-accuracy/core/lazy_frame.hpp"
#include "fcst-accuracy/metrics/metric_helpers.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fcstaccuracy::metrics {

enum class RatioMetricKind {
	Wape,
	Bias
};

/**
 * @struct RatioMetricOptions
 * @brief Column roles of a metric call.
 */
struct RatioMetricOptions {
	std::string id_col = "unique_id";
	std::string target_col = "y";
	std::string cutoff_col = "cutoff";
};

/**
 * @class RatioMetricEngine
 * @brief Computes grouped `sum(error) / sum(actual)` metrics for several models at once.
 *
 * For every model the numerator is `target - model` (its magnitude for WAPE)
 * and the denominator is `target`; both are masked wherever that model has no
 * prediction, so each model is scored on its own rows only. Sums are taken
 * per group (`[cutoff_col, id_col]` when the cutoff column exists, else
 * `[id_col]`) before dividing. A zero denominator sum yields an undefined
 * cell. The result has the group columns followed by one column per model and
 * is sorted ascending by the group columns.
 */
class RatioMetricEngine {
public:
	explicit RatioMetricEngine(RatioMetricKind kind,
	                           std::shared_ptr<const IMetricHelpers> helpers = defaultMetricHelpers());

	RatioMetricKind kind() const {
		return kind_;
	}

	bool absoluteError() const {
		return kind_ == RatioMetricKind::Wape;
	}

	/**
	 * @brief Gets the metric name ("WAPE" or "BIAS").
	 */
	std::string getName() const;

	/**
	 * @brief Computes the metric over a lazy frame.
	 * @param frame Input observations; left untouched.
	 * @param models Prediction columns, in output order. May be empty.
	 * @param options Column roles.
	 * @return A new lazy frame of the same backend.
	 * @throws core::ColumnNotFoundError If the id, target or a model column is missing.
	 * @throws std::invalid_argument If a model is listed twice or names the target or a group column.
	 * @throws std::invalid_argument If the target, id and (present) cutoff roles do not name distinct columns.
	 */
	std::unique_ptr<core::ILazyFrame> evaluate(const core::ILazyFrame &frame, const std::vector<std::string> &models,
	                                           const RatioMetricOptions &options = {}) const;

	/**
	 * @brief Computes the metric over a native tabular object and returns the same native type.
	 */
	template <typename Native>
	Native compute(const Native &df, const std::vector<std::string> &models,
	               const RatioMetricOptions &options = {}) const {
		auto lazy = core::FrameAdapter<Native>::fromNative(df);
		auto result = evaluate(*lazy, models, options);
		return core::FrameAdapter<Native>::toNative(*result);
	}

private:
	void validateSchema(const std::vector<std::string> &columns, const std::vector<std::string> &models,
	                    const RatioMetricOptions &options) const;
	core::Expr errorExpression(const std::string &target_col, const std::string &model) const;

	RatioMetricKind kind_;
	std::shared_ptr<const IMetricHelpers> helpers_;
};

/**
 * @brief Weighted Absolute Percentage Error per series (and cutoff).
 *
 * Sums the absolute errors (actual - forecast) over all periods with available
 * forecasts and divides by the sum of actuals over the same periods.
 */
template <typename Native>
Native wape(const Native &df, const std::vector<std::string> &models, const std::string &id_col = "unique_id",
            const std::string &target_col = "y", const std::string &cutoff_col = "cutoff") {
	return RatioMetricEngine(RatioMetricKind::Wape).compute(df, models, RatioMetricOptions {id_col, target_col, cutoff_col});
}

/**
 * @brief Relative bias per series (and cutoff).
 *
 * Sums the signed errors (actual - forecast) over all periods with available
 * forecasts and scales by the sum of actuals over those periods. Positive
 * values mean the model under-forecasts.
 */
template <typename Native>
Native bias(const Native &df, const std::vector<std::string> &models, const std::string &id_col = "unique_id",
            const std::string &target_col = "y", const std::string &cutoff_col = "cutoff") {
	return RatioMetricEngine(RatioMetricKind::Bias).compute(df, models, RatioMetricOptions {id_col, target_col, cutoff_col});
}

} // namespace fcstaccuracy::metrics
