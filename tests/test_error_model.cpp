// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <fstream>

#include "datadem/uncertainty/error_model.hpp"

using namespace datadem;

// ─── Binning ────────────────────────────────────────────────────────────────

TEST(BinErrorsTest, PopulationStdPerBinWithAnchor) {
  auto binned = binErrors({1.0, 1.0, 2.0, 2.0}, {1.0, -1.0, 3.0, -3.0}, 2);
  ASSERT_EQ(binned.x.size(), 3u);
  EXPECT_DOUBLE_EQ(binned.x[0], 0.0);
  EXPECT_DOUBLE_EQ(binned.y[0], 0.0);
  EXPECT_DOUBLE_EQ(binned.x[1], 1.25);
  EXPECT_DOUBLE_EQ(binned.y[1], 1.0);
  EXPECT_DOUBLE_EQ(binned.x[2], 1.75);
  EXPECT_DOUBLE_EQ(binned.y[2], 3.0);
}

TEST(BinErrorsTest, ShrinksUntilEveryBinHasTwoSamples) {
  auto binned = binErrors({0.0, 0.1, 5.0, 10.0}, {1.0, 2.0, 3.0, 4.0});
  // Two bins of width 5 remain, plus the anchor
  ASSERT_EQ(binned.x.size(), 3u);
  EXPECT_DOUBLE_EQ(binned.x[1], 2.5);
  EXPECT_DOUBLE_EQ(binned.y[1], 0.5);
}

TEST(BinErrorsTest, EdgeCases) {
  EXPECT_EQ(binErrors({}, {}).x.size(), 1u);
  EXPECT_THROW(binErrors({1.0}, {}), std::invalid_argument);

  // Constant predictor collapses to one bin
  auto binned = binErrors({3.0, 3.0, 3.0}, {1.0, 1.0, 1.0});
  ASSERT_EQ(binned.x.size(), 2u);
  EXPECT_DOUBLE_EQ(binned.x[1], 3.0);
  EXPECT_DOUBLE_EQ(binned.y[1], 0.0);
}

// ─── Fitting ────────────────────────────────────────────────────────────────

TEST(PowerLawFitTest, RecoversKnownParameters) {
  const ErrorModel truth{0.3, 0.5, 1.3};
  std::vector<double> x, y;
  for (int i = 1; i <= 40; ++i) {
    x.push_back(0.5 * i);
    y.push_back(truth.evaluate(x.back()));
  }

  auto model = fitPowerLaw(x, y);
  EXPECT_NEAR(model.p0, truth.p0, 1e-4);
  EXPECT_NEAR(model.p1, truth.p1, 1e-4);
  EXPECT_NEAR(model.p2, truth.p2, 1e-4);
}

TEST(PowerLawFitTest, RecoversSublinearCurveThroughOrigin) {
  const ErrorModel truth{0.0, 2.0, 0.5};
  std::vector<double> x = {0.0}, y = {0.0};
  for (int i = 1; i <= 30; ++i) {
    x.push_back(i);
    y.push_back(truth.evaluate(i));
  }

  auto model = fitPowerLaw(x, y);
  EXPECT_NEAR(model.p0, 0.0, 1e-4);
  EXPECT_NEAR(model.p1, 2.0, 1e-4);
  EXPECT_NEAR(model.p2, 0.5, 1e-4);
}

TEST(PowerLawFitTest, ExponentIsNonNegative) {
  auto model = fitPowerLaw({1.0, 2.0, 4.0, 8.0}, {1.0, 0.5, 0.25, 0.125});
  EXPECT_GE(model.p2, 0.0);
  EXPECT_THROW(fitPowerLaw({1.0}, {}), std::invalid_argument);
}

TEST(ErrorModelTest, EvaluateUsesAbsoluteValues) {
  ErrorModel m{1.0, 2.0, -2.0};
  EXPECT_DOUBLE_EQ(m.evaluate(-3.0), 19.0);
  EXPECT_DOUBLE_EQ(m.evaluate(0.0), 1.0);
}

TEST(ErrorModelTest, FitFromSamples) {
  EXPECT_FALSE(fitErrorModel({}, Predictor::Distance).has_value());
  EXPECT_FALSE(
      fitErrorModel({{1.0, 1.0, 1.0}}, Predictor::Distance).has_value());

  // Error spread grows linearly with distance, slope carries no signal
  std::vector<ErrorSample> samples;
  for (int d = 1; d <= 10; ++d) {
    samples.push_back({0.5 * d, static_cast<double>(d), 5.0});
    samples.push_back({-0.5 * d, static_cast<double>(d), 5.0});
  }
  auto model = fitErrorModel(samples, Predictor::Distance);
  ASSERT_TRUE(model.has_value());
  EXPECT_GT(model->evaluate(10.0), model->evaluate(1.0));
  EXPECT_NEAR(model->evaluate(5.0), 2.5, 0.5);

  EXPECT_TRUE(fitErrorModel(samples, Predictor::Slope).has_value());
}

TEST(ErrorModelTest, ApplyKeepsNodata) {
  Raster prox(GridSpec::fromRegion(Region(0, 2, 0, 1), 1.0));
  prox(0, 0) = 2.0f;
  auto unc = applyErrorModel(ErrorModel{1.0, 1.0, 2.0}, prox);
  EXPECT_FLOAT_EQ(unc(0, 0), 5.0f);
  EXPECT_FALSE(unc.isValid(0, 1));
}

TEST(ErrorModelTest, WriteSamples) {
  const std::string path = "/tmp/datadem_errors.err";
  writeErrorSamples(path, {{0.5, 2.0, 10.0}, {-1.0, 3.0, 20.0}},
                    Predictor::Slope);
  std::ifstream in(path);
  double e = 0.0, p = 0.0;
  ASSERT_TRUE(in >> e >> p);
  EXPECT_DOUBLE_EQ(e, 0.5);
  EXPECT_DOUBLE_EQ(p, 10.0);
  ASSERT_TRUE(in >> e >> p);
  EXPECT_DOUBLE_EQ(e, -1.0);

  EXPECT_THROW(writeErrorSamples("/nonexistent_dir/x.err", {},
                                 Predictor::Distance),
               std::runtime_error);
}
