// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * synthetic.hpp
 *
 * Synthetic surface samples for examples.
 */

#ifndef EXAMPLES_COMMON_SYNTHETIC_HPP
#define EXAMPLES_COMMON_SYNTHETIC_HPP

#include <Eigen/Geometry>
#include <cmath>
#include <random>

#include <meshreg/types.hpp>

namespace examples {

/// Ellipsoid with semi-axes (a, b, c) sampled on a Fibonacci lattice.
inline meshreg::FeatureMatrix generateEllipsoid(int n, double a = 1.0,
                                                double b = 0.7,
                                                double c = 0.5) {
  const double golden = M_PI * (3.0 - std::sqrt(5.0));
  meshreg::FeatureMatrix f(n, meshreg::kFeatureDim);
  for (int i = 0; i < n; ++i) {
    const double z = 1.0 - 2.0 * (i + 0.5) / n;
    const double r = std::sqrt(1.0 - z * z);
    const double x = r * std::cos(golden * i);
    const double y = r * std::sin(golden * i);
    const Eigen::Vector3d normal =
        Eigen::Vector3d(x / a, y / b, z / c).normalized();
    f.row(i) << a * x, b * y, c * z, normal.x(), normal.y(), normal.z();
  }
  return f;
}

/// Add isotropic Gaussian noise to the positions.
inline void addNoise(meshreg::FeatureMatrix& features, double stddev,
                     unsigned seed = 0) {
  std::mt19937 gen(seed);
  std::normal_distribution<double> noise(0.0, stddev);
  for (int i = 0; i < features.rows(); ++i) {
    for (int d = 0; d < 3; ++d) features(i, d) += noise(gen);
  }
}

/// Rotation about @p axis by @p angle [rad] followed by @p translation.
inline meshreg::Transform makeTransform(double angle,
                                        const Eigen::Vector3d& axis,
                                        const Eigen::Vector3d& translation) {
  meshreg::Transform T = meshreg::Transform::Identity();
  T.topLeftCorner<3, 3>() =
      Eigen::AngleAxisd(angle, axis.normalized()).toRotationMatrix();
  T.topRightCorner<3, 1>() = translation;
  return T;
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_SYNTHETIC_HPP
