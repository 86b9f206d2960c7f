// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_transform.hpp
 *
 * Weighted similarity transform (rotation, isotropic scale, translation)
 * between corresponding point sets, via Horn's unit quaternion method.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_TRANSFORM_RIGID_TRANSFORM_HPP
#define MESHREG_TRANSFORM_RIGID_TRANSFORM_HPP

#include <Eigen/Core>

#include "meshreg/types.hpp"

namespace meshreg {

/// Decomposed similarity transform: x -> scale * rotation * x + translation.
struct SimilarityTransform {
  Eigen::Matrix3d rotation = Eigen::Matrix3d::Identity();
  double scale = 1.0;
  Eigen::Vector3d translation = Eigen::Vector3d::Zero();

  /// Homogeneous 4x4 form [scale * rotation | translation].
  Transform matrix() const;
};

/**
 * @brief Weighted least-squares similarity transform.
 *
 * Minimizes Σ w_i ||s·R·x_i + t − y_i||². The rotation quaternion is the
 * eigenvector of Horn's symmetric 4x4 matrix Q whose eigenvalue has the
 * largest absolute value. Eigenvalues are visited in the solver's ascending
 * order and the first strictly larger magnitude wins; a runner-up within
 * relative tolerance of the winner is reported as DegenerateState, so the
 * ordering never decides the result.
 *
 * With @p adjust_scale false the returned scale is exactly 1.
 *
 * @param floating Points x_i (N x 3)
 * @param corresponding Points y_i (N x 3)
 * @param weights Non-negative weights w_i (N)
 * @throws InvalidArgument on shape mismatch or negative / non-finite weights
 * @throws DegenerateState if Σw = 0, the weighted floating points are
 *         collinear, the dominant eigenvalue is not unique, or the estimated
 *         scale is not positive
 */
SimilarityTransform estimateRigidTransform(
    const Eigen::Ref<const PositionMatrix>& floating,
    const Eigen::Ref<const PositionMatrix>& corresponding,
    const WeightVector& weights, bool adjust_scale);

/**
 * @brief Estimate the transform and apply it to @p floating in place.
 * @return The applied 4x4 homogeneous transform
 */
Transform estimateAndApplyRigidTransform(
    Eigen::Ref<PositionMatrix> floating, const WeightVector& weights,
    const Eigen::Ref<const PositionMatrix>& corresponding, bool adjust_scale);

/// Apply a homogeneous transform to every row of @p positions.
void applyTransform(Eigen::Ref<PositionMatrix> positions,
                    const Transform& transform);

/// Transform feature positions; rotate and renormalize feature normals.
void applyTransform(FeatureMatrix& features, const Transform& transform);

}  // namespace meshreg

#endif  // MESHREG_TRANSFORM_RIGID_TRANSFORM_HPP
