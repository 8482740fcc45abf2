// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * error_model.hpp
 *
 * Power-law interpolation error model and its least-squares fit.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef DATADEM_UNCERTAINTY_ERROR_MODEL_HPP
#define DATADEM_UNCERTAINTY_ERROR_MODEL_HPP

#include <Eigen/Core>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "datadem/grid/raster.hpp"

namespace datadem {

/// One withheld-point observation from a split-sample trial.
struct ErrorSample {
  double error = 0.0;     ///< observed - predicted
  double distance = 0.0;  ///< Cells to the nearest trial data cell
  double slope = 0.0;     ///< Degrees
};

/// Which ErrorSample field acts as the predictor.
enum class Predictor { Distance, Slope };

/**
 * @brief error ~ p0 + p1 * |x|^|p2|
 */
struct ErrorModel {
  double p0 = 0.0;
  double p1 = 0.0;
  double p2 = 0.0;

  double evaluate(double x) const {
    return p0 + p1 * std::pow(std::abs(x), std::abs(p2));
  }

  Eigen::Vector3d params() const { return {p0, p1, p2}; }
};

/// Bin centers and per-bin error spread, anchored at (0, 0).
struct BinnedErrors {
  std::vector<double> x;
  std::vector<double> y;
};

/**
 * @brief Histogram error spread against the predictor.
 *
 * Starts from max_bins equal-width bins over [min, max] of the predictor
 * and removes bins until every bin holds at least two samples (or one bin
 * remains). y is the population standard deviation of the error in each
 * bin; a (0, 0) point is prepended.
 */
BinnedErrors binErrors(const std::vector<double>& predictor,
                       const std::vector<double>& error, int max_bins = 10);

/// Levenberg-Marquardt settings.
struct PowerLawFitOptions {
  Eigen::Vector3d initial{0.0, 0.1, 0.2};
  double init_lambda = 1e-3;
  double lambda_factor = 10.0;
  int max_iterations = 200;
  int max_inner_iterations = 10;
  double tolerance = 1e-12;
};

/**
 * @brief Least-squares fit of the power law through (x, y).
 *
 * The returned model has p2 >= 0.
 */
ErrorModel fitPowerLaw(const std::vector<double>& x,
                       const std::vector<double>& y,
                       const PowerLawFitOptions& options = {});

/**
 * @brief Bin the first max_samples samples and fit the power law.
 * @return nullopt if fewer than two samples are available
 */
std::optional<ErrorModel> fitErrorModel(const std::vector<ErrorSample>& samples,
                                        Predictor predictor,
                                        size_t max_samples = 50000000);

/// Evaluate the model on every valid cell; nodata elsewhere.
Raster applyErrorModel(const ErrorModel& model, const Raster& predictor);

/// Write "error predictor" lines. @throws std::runtime_error on failure
void writeErrorSamples(const std::string& path,
                       const std::vector<ErrorSample>& samples,
                       Predictor predictor);

}  // namespace datadem

#endif  // DATADEM_UNCERTAINTY_ERROR_MODEL_HPP
