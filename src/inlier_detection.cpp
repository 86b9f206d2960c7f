// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * inlier_detection.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshreg/inlier/inlier_detection.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "meshreg/exceptions.hpp"

namespace meshreg {

namespace {

/// Zero-mean normal density at x.
inline double gaussian(double x, double sigma) {
  static const double inv_sqrt_2pi = 1.0 / std::sqrt(2.0 * M_PI);
  const double z = x / sigma;
  return inv_sqrt_2pi / sigma * std::exp(-0.5 * z * z);
}

}  // namespace

InlierStatistics detectInliers(const FeatureMatrix& features,
                               const FeatureMatrix& corresponding_features,
                               const FlagVector& corresponding_flags,
                               WeightVector& probability,
                               const config::Inlier& config) {
  const Eigen::Index n = features.rows();
  if (corresponding_features.rows() != n || corresponding_flags.size() != n ||
      probability.size() != n) {
    throw InvalidArgument(
        "InlierDetection",
        "features (" + std::to_string(n) + "), corresponding features (" +
            std::to_string(corresponding_features.rows()) +
            "), flags (" + std::to_string(corresponding_flags.size()) +
            ") and probabilities (" + std::to_string(probability.size()) +
            ") must have equal length");
  }

  // 1. Flag gate
  for (Eigen::Index i = 0; i < n; ++i) {
    if (corresponding_flags[i] < 0.5) probability[i] = 0.0;
  }

  // 2. Residual mixture model (single re-estimation of sigma)
  const Eigen::VectorXd residual =
      (corresponding_features - features).rowwise().norm();

  const double weight_sum = probability.sum();
  if (!(weight_sum > 0.0)) {
    throw DegenerateState("InlierDetection",
                          "all inlier probabilities are zero, sigma undefined");
  }
  const double weighted_sq =
      probability.dot(residual.cwiseProduct(residual));

  InlierStatistics stats;
  stats.sigma = std::max(std::sqrt(weighted_sq / weight_sum), config.min_sigma);
  stats.lambda = gaussian(config.kappa * stats.sigma, stats.sigma);
  if (!std::isfinite(stats.sigma) || !std::isfinite(stats.lambda)) {
    throw DegenerateState("InlierDetection", "non-finite residual statistics");
  }

  for (Eigen::Index i = 0; i < n; ++i) {
    if (corresponding_flags[i] < 0.5) continue;
    const double g = gaussian(residual[i], stats.sigma);
    const double denom = g + stats.lambda;
    probability[i] = (denom > 0.0) ? g / denom : 0.0;
  }

  // 3. Normal agreement, rescaled from [-1, 1] to [0, 1]
  if (config.use_orientation) {
    for (Eigen::Index i = 0; i < n; ++i) {
      const double dot = features.row(i).tail<3>().dot(
          corresponding_features.row(i).tail<3>());
      probability[i] *= std::clamp(dot / 2.0 + 0.5, 0.0, 1.0);
    }
  }

  return stats;
}

}  // namespace meshreg
