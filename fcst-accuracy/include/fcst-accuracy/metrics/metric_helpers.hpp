#pragma once

#include "fcst-accuracy/core/expression.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fcstaccuracy::metrics {

/**
 * @brief Derives the grouping columns of a metric call from a schema.
 *
 * Returns `{cutoff_col, id_col}` when `cutoff_col` is one of `columns`,
 * `{id_col}` otherwise.
 */
std::vector<std::string> resolveGroupColumns(const std::vector<std::string> &columns, const std::string &id_col,
                                             const std::string &cutoff_col);

/**
 * @class IMetricHelpers
 * @brief Small building blocks shared by the grouped ratio metrics.
 */
class IMetricHelpers {
public:
	virtual ~IMetricHelpers() = default;

	/**
	 * @brief Grouping columns for a dataset with the given columns.
	 */
	virtual std::vector<std::string> groupColumns(const std::vector<std::string> &columns, const std::string &id_col,
	                                              const std::string &cutoff_col) const = 0;

	/**
	 * @brief Wraps a denominator so that exact zeros become undefined.
	 */
	virtual core::Expr zeroToUndefined(const core::Expr &value) const = 0;

	virtual std::string getName() const = 0;
};

/**
 * @class NativeMetricHelpers
 * @brief Delegates the zero guard to the backend's own NULLIF primitive.
 */
class NativeMetricHelpers final : public IMetricHelpers {
public:
	std::vector<std::string> groupColumns(const std::vector<std::string> &columns, const std::string &id_col,
	                                      const std::string &cutoff_col) const override;
	core::Expr zeroToUndefined(const core::Expr &value) const override;
	std::string getName() const override {
		return "NativeMetricHelpers";
	}
};

/**
 * @class PortableMetricHelpers
 * @brief Self-contained helpers built only from conditional expressions.
 */
class PortableMetricHelpers final : public IMetricHelpers {
public:
	std::vector<std::string> groupColumns(const std::vector<std::string> &columns, const std::string &id_col,
	                                      const std::string &cutoff_col) const override;
	core::Expr zeroToUndefined(const core::Expr &value) const override;
	std::string getName() const override {
		return "PortableMetricHelpers";
	}
};

/**
 * @brief Helpers used when none are injected (NativeMetricHelpers).
 */
std::shared_ptr<const IMetricHelpers> defaultMetricHelpers();

} // namespace fcstaccuracy::metrics
