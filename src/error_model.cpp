// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * error_model.cpp
 *
 * Binned error statistics and a damped Gauss-Newton (Levenberg-Marquardt)
 * power-law fit.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "datadem/uncertainty/error_model.hpp"

#include <Eigen/Dense>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace datadem {

namespace {

double predictorOf(const ErrorSample& s, Predictor p) {
  return p == Predictor::Distance ? s.distance : s.slope;
}

std::vector<int> histogram(const std::vector<double>& values, double lo,
                           double hi, int bins) {
  std::vector<int> counts(bins, 0);
  const double width = (hi - lo) / bins;
  for (double v : values) {
    int b = static_cast<int>((v - lo) / width);
    counts[std::clamp(b, 0, bins - 1)]++;
  }
  return counts;
}

double sumSquares(const Eigen::VectorXd& x, const Eigen::VectorXd& y,
                  const Eigen::Vector3d& p) {
  double sse = 0.0;
  for (Eigen::Index i = 0; i < x.size(); ++i) {
    const double r =
        y(i) - (p(0) + p(1) * std::pow(std::abs(x(i)), std::abs(p(2))));
    sse += r * r;
  }
  return sse;
}

}  // namespace

BinnedErrors binErrors(const std::vector<double>& predictor,
                       const std::vector<double>& error, int max_bins) {
  if (predictor.size() != error.size()) {
    throw std::invalid_argument("binErrors: predictor/error size mismatch");
  }
  BinnedErrors out;
  out.x.push_back(0.0);
  out.y.push_back(0.0);
  if (predictor.empty()) return out;

  auto [min_it, max_it] = std::minmax_element(predictor.begin(),
                                              predictor.end());
  double lo = *min_it;
  double hi = *max_it;
  if (lo == hi) {
    lo -= 0.5;
    hi += 0.5;
  }

  int bins = std::max(1, max_bins);
  auto counts = histogram(predictor, lo, hi, bins);
  while (bins > 1 && std::any_of(counts.begin(), counts.end(),
                                 [](int n) { return n <= 1; })) {
    --bins;
    counts = histogram(predictor, lo, hi, bins);
  }

  const double width = (hi - lo) / bins;
  std::vector<double> sum(bins, 0.0), sum2(bins, 0.0);
  for (size_t i = 0; i < predictor.size(); ++i) {
    const int b = std::clamp(static_cast<int>((predictor[i] - lo) / width), 0,
                             bins - 1);
    sum[b] += error[i];
    sum2[b] += error[i] * error[i];
  }

  for (int b = 0; b < bins; ++b) {
    if (counts[b] == 0) continue;
    const double mean = sum[b] / counts[b];
    const double var = std::max(0.0, sum2[b] / counts[b] - mean * mean);
    out.x.push_back(lo + (b + 0.5) * width);
    out.y.push_back(std::sqrt(var));
  }
  return out;
}

ErrorModel fitPowerLaw(const std::vector<double>& xs,
                       const std::vector<double>& ys,
                       const PowerLawFitOptions& options) {
  if (xs.size() != ys.size()) {
    throw std::invalid_argument("fitPowerLaw: x/y size mismatch");
  }
  const auto n = static_cast<Eigen::Index>(xs.size());
  const Eigen::VectorXd x = Eigen::Map<const Eigen::VectorXd>(xs.data(), n);
  const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(ys.data(), n);

  Eigen::Vector3d p = options.initial;
  double lambda = options.init_lambda;
  double error = sumSquares(x, y, p);

  for (int iter = 0; iter < options.max_iterations; ++iter) {
    // Jacobian of the model and residuals y - f(p)
    Eigen::MatrixXd J(n, 3);
    Eigen::VectorXd r(n);
    const double exponent = std::abs(p(2));
    const double sign = p(2) < 0.0 ? -1.0 : 1.0;
    for (Eigen::Index i = 0; i < n; ++i) {
      const double ax = std::abs(x(i));
      const double pw = std::pow(ax, exponent);
      J(i, 0) = 1.0;
      J(i, 1) = pw;
      J(i, 2) = ax > 0.0 ? p(1) * pw * std::log(ax) * sign : 0.0;
      r(i) = y(i) - (p(0) + p(1) * pw);
    }

    const Eigen::Matrix3d H = J.transpose() * J;
    const Eigen::Vector3d b = -J.transpose() * r;

    bool improved = false;
    Eigen::Vector3d delta = Eigen::Vector3d::Zero();
    for (int inner = 0; inner < options.max_inner_iterations; ++inner) {
      // (H + lambda * I) * delta = -b
      const Eigen::Matrix3d H_damped = H + lambda * Eigen::Matrix3d::Identity();
      delta = H_damped.ldlt().solve(-b);
      const Eigen::Vector3d candidate = p + delta;
      const double new_error = sumSquares(x, y, candidate);

      if (std::isfinite(new_error) && new_error < error) {
        lambda /= options.lambda_factor;
        p = candidate;
        const double gain = error - new_error;
        error = new_error;
        improved = gain > options.tolerance * std::max(1.0, error);
        break;
      }
      lambda *= options.lambda_factor;
    }

    if (!improved || delta.norm() < options.tolerance) break;
  }

  return {p(0), p(1), std::abs(p(2))};
}

std::optional<ErrorModel> fitErrorModel(const std::vector<ErrorSample>& samples,
                                        Predictor predictor,
                                        size_t max_samples) {
  const size_t n = std::min(samples.size(), max_samples);
  if (n < 2) return std::nullopt;

  std::vector<double> x(n), e(n);
  for (size_t i = 0; i < n; ++i) {
    x[i] = predictorOf(samples[i], predictor);
    e[i] = samples[i].error;
  }

  const auto binned = binErrors(x, e);
  const auto model = fitPowerLaw(binned.x, binned.y);
  spdlog::info("[Uncertainty] {} fit over {} samples ({} bins): {} {} {}",
               predictor == Predictor::Distance ? "distance" : "slope", n,
               binned.x.size() - 1, model.p0, model.p1, model.p2);
  return model;
}

Raster applyErrorModel(const ErrorModel& model, const Raster& predictor) {
  Raster out(predictor.spec());
  for (int r = 0; r < predictor.rows(); ++r) {
    for (int c = 0; c < predictor.cols(); ++c) {
      if (!predictor.isValid(r, c)) continue;
      out(r, c) = static_cast<float>(model.evaluate(predictor(r, c)));
    }
  }
  return out;
}

void writeErrorSamples(const std::string& path,
                       const std::vector<ErrorSample>& samples,
                       Predictor predictor) {
  std::ofstream out(path);
  if (!out.is_open()) {
    throw std::runtime_error("Cannot open error sample file: " + path);
  }
  for (const auto& s : samples) {
    out << fmt::format("{:f} {:f}\n", s.error, predictorOf(s, predictor));
  }
  if (!out) throw std::runtime_error("Failed writing error samples: " + path);
}

}  // namespace datadem
