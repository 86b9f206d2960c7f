// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * types.hpp
 *
 * Matrix type aliases shared by all registration stages.
 */

#ifndef MESHREG_TYPES_HPP
#define MESHREG_TYPES_HPP

#include <Eigen/Core>
#include <Eigen/SparseCore>

namespace meshreg {

/// Number of scalars per feature: position (3) followed by unit normal (3).
constexpr int kFeatureDim = 6;

/// One feature per row: [x, y, z, nx, ny, nz].
using FeatureMatrix = Eigen::Matrix<double, Eigen::Dynamic, kFeatureDim>;

/// One position per row.
using PositionMatrix = Eigen::Matrix<double, Eigen::Dynamic, 3>;

/// Per-element validity flag in [0, 1].
using FlagVector = Eigen::VectorXd;

/// Per-element scalar weight (inlier probability, transform weight).
using WeightVector = Eigen::VectorXd;

/// Row-stochastic soft correspondence, shape (N_source, N_target).
using AffinityMatrix = Eigen::SparseMatrix<double, Eigen::RowMajor>;

/// Homogeneous similarity transform [s*R | t].
using Transform = Eigen::Matrix4d;

}  // namespace meshreg

#endif  // MESHREG_TYPES_HPP
