#include "fcst-accuracy/metrics/metric_helpers.hpp"

#include <algorithm>

namespace fcstaccuracy::metrics {

std::vector<std::string> resolveGroupColumns(const std::vector<std::string> &columns, const std::string &id_col,
                                             const std::string &cutoff_col) {
	if (std::find(columns.begin(), columns.end(), cutoff_col) != columns.end()) {
		return {cutoff_col, id_col};
	}
	return {id_col};
}

// --- NativeMetricHelpers ---

std::vector<std::string> NativeMetricHelpers::groupColumns(const std::vector<std::string> &columns,
                                                           const std::string &id_col,
                                                           const std::string &cutoff_col) const {
	return resolveGroupColumns(columns, id_col, cutoff_col);
}

core::Expr NativeMetricHelpers::zeroToUndefined(const core::Expr &value) const {
	return value.nullIf(0.0);
}

// --- PortableMetricHelpers ---

std::vector<std::string> PortableMetricHelpers::groupColumns(const std::vector<std::string> &columns,
                                                             const std::string &id_col,
                                                             const std::string &cutoff_col) const {
	return resolveGroupColumns(columns, id_col, cutoff_col);
}

core::Expr PortableMetricHelpers::zeroToUndefined(const core::Expr &value) const {
	return core::when(value.eq(core::lit(0.0))).then(core::undefined()).otherwise(value);
}

std::shared_ptr<const IMetricHelpers> defaultMetricHelpers() {
	static const auto helpers = std::make_shared<const NativeMetricHelpers>();
	return helpers;
}

} // namespace fcstaccuracy::metrics
