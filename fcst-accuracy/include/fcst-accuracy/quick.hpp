#pragma once

#include "fcst-accuracy/backends/memory_frame.hpp"
#include "fcst-accuracy/core/frame.hpp"
#include "fcst-accuracy/metrics/ratio_metric.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fcstaccuracy::quick {

/**
 * @brief A named prediction column for forecastFrame().
 */
struct ModelPredictions {
	std::string name;
	std::vector<std::optional<double>> values;
};

/**
 * @brief Builds a frame with `unique_id`, `y` and one column per model.
 * @throws std::invalid_argument If the inputs do not share one length.
 */
inline core::Frame forecastFrame(const std::vector<std::string> &ids, const std::vector<double> &actual,
                                 const std::vector<ModelPredictions> &models) {
	if (ids.size() != actual.size()) {
		throw std::invalid_argument("Ids and actual values must have the same length.");
	}

	std::vector<std::optional<std::string>> id_cells(ids.begin(), ids.end());
	std::vector<std::optional<double>> actual_cells(actual.begin(), actual.end());

	core::Frame frame;
	frame.addColumn(core::Column::utf8("unique_id", id_cells));
	frame.addColumn(core::Column::float64("y", actual_cells));
	for (const auto &model : models) {
		frame.addColumn(core::Column::float64(model.name, model.values));
	}
	return frame;
}

/**
 * @brief WAPE per series for plain vectors.
 */
inline core::Frame wape(const std::vector<std::string> &ids, const std::vector<double> &actual,
                        const std::vector<ModelPredictions> &models) {
	std::vector<std::string> names;
	names.reserve(models.size());
	for (const auto &model : models) {
		names.push_back(model.name);
	}
	return metrics::wape(forecastFrame(ids, actual, models), names);
}

/**
 * @brief Relative bias per series for plain vectors.
 */
inline core::Frame bias(const std::vector<std::string> &ids, const std::vector<double> &actual,
                        const std::vector<ModelPredictions> &models) {
	std::vector<std::string> names;
	names.reserve(models.size());
	for (const auto &model : models) {
		names.push_back(model.name);
	}
	return metrics::bias(forecastFrame(ids, actual, models), names);
}

} // namespace fcstaccuracy::quick
