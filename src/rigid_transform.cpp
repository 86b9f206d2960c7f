// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_transform.cpp
 *
 * Horn, "Closed-form solution of absolute orientation using unit
 * quaternions", JOSA A 4(4), 1987.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshreg/transform/rigid_transform.hpp"

#include <Eigen/Eigenvalues>
#include <cmath>
#include <string>

#include "meshreg/exceptions.hpp"

namespace meshreg {

namespace {

/// Second largest scatter eigenvalue below this fraction of the largest
/// means the weighted points lie on a line.
constexpr double kCollinearTolerance = 1e-12;

/// Relative gap below which two eigenvalue magnitudes count as tied.
constexpr double kEigenvalueTieTolerance = 1e-9;

/// Rotation matrix of the unit quaternion q = (w, x, y, z).
Eigen::Matrix3d quaternionToRotation(const Eigen::Vector4d& q) {
  const double w = q(0), x = q(1), y = q(2), z = q(3);
  Eigen::Matrix3d R;
  R(0, 0) = w * w + x * x - y * y - z * z;
  R(1, 1) = w * w + y * y - x * x - z * z;
  R(2, 2) = w * w + z * z - x * x - y * y;
  R(1, 0) = 2.0 * (x * y + w * z);
  R(0, 1) = 2.0 * (x * y - w * z);
  R(2, 0) = 2.0 * (x * z - w * y);
  R(0, 2) = 2.0 * (x * z + w * y);
  R(2, 1) = 2.0 * (y * z + w * x);
  R(1, 2) = 2.0 * (y * z - w * x);
  return R;
}

}  // namespace

Transform SimilarityTransform::matrix() const {
  Transform T = Transform::Identity();
  T.topLeftCorner<3, 3>() = scale * rotation;
  T.topRightCorner<3, 1>() = translation;
  return T;
}

SimilarityTransform estimateRigidTransform(
    const Eigen::Ref<const PositionMatrix>& floating,
    const Eigen::Ref<const PositionMatrix>& corresponding,
    const WeightVector& weights, bool adjust_scale) {
  const Eigen::Index n = floating.rows();
  if (corresponding.rows() != n || weights.size() != n) {
    throw InvalidArgument(
        "RigidTransform",
        "floating (" + std::to_string(n) + "), corresponding (" +
            std::to_string(corresponding.rows()) + ") and weights (" +
            std::to_string(weights.size()) + ") must have equal length");
  }
  if (!weights.allFinite() || (n > 0 && weights.minCoeff() < 0.0)) {
    throw InvalidArgument("RigidTransform",
                          "weights must be finite and non-negative");
  }

  // 1. Weighted centroids
  const double weight_sum = weights.sum();
  if (!(weight_sum > 0.0)) {
    throw DegenerateState("RigidTransform", "total weight is zero");
  }
  const Eigen::Vector3d floating_centroid =
      floating.transpose() * weights / weight_sum;
  const Eigen::Vector3d corresponding_centroid =
      corresponding.transpose() * weights / weight_sum;

  const PositionMatrix floating_centered =
      floating.rowwise() - floating_centroid.transpose();

  // At least three non-collinear weighted points are needed for a rotation
  const Eigen::Matrix3d scatter = floating_centered.transpose() *
                                  weights.asDiagonal() * floating_centered /
                                  weight_sum;
  const Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> scatter_solver(
      scatter, Eigen::EigenvaluesOnly);
  const Eigen::Vector3d spread = scatter_solver.eigenvalues();
  if (!(spread(2) > 0.0) || spread(1) <= kCollinearTolerance * spread(2)) {
    throw DegenerateState("RigidTransform",
                          "weighted floating points are collinear");
  }

  // 2. Cross-covariance
  const Eigen::Matrix3d C =
      floating.transpose() * weights.asDiagonal() * corresponding / weight_sum -
      floating_centroid * corresponding_centroid.transpose();

  // 3. Cyclic components of the antisymmetric part
  const Eigen::Vector3d delta(C(1, 2) - C(2, 1), C(2, 0) - C(0, 2),
                              C(0, 1) - C(1, 0));

  // 4. Symmetric 4x4 matrix Q
  const double trace = C.trace();
  Eigen::Matrix4d Q;
  Q(0, 0) = trace;
  Q.block<1, 3>(0, 1) = delta.transpose();
  Q.block<3, 1>(1, 0) = delta;
  Q.block<3, 3>(1, 1) =
      C + C.transpose() - trace * Eigen::Matrix3d::Identity();

  // 5. Eigenvector of the eigenvalue with largest magnitude
  const Eigen::SelfAdjointEigenSolver<Eigen::Matrix4d> solver(Q);
  if (solver.info() != Eigen::Success) {
    throw DegenerateState("RigidTransform", "eigen decomposition failed");
  }
  const Eigen::Vector4d& eigenvalues = solver.eigenvalues();

  int dominant = 0;
  double max_magnitude = 0.0;
  for (int i = 0; i < 4; ++i) {
    if (std::abs(eigenvalues(i)) > max_magnitude) {
      max_magnitude = std::abs(eigenvalues(i));
      dominant = i;
    }
  }
  for (int i = 0; i < 4; ++i) {
    if (i == dominant) continue;
    if (max_magnitude - std::abs(eigenvalues(i)) <=
        kEigenvalueTieTolerance * max_magnitude) {
      throw DegenerateState(
          "RigidTransform",
          "largest eigenvalue magnitude " + std::to_string(max_magnitude) +
              " is not unique, rotation is ambiguous");
    }
  }

  // 6. Quaternion to rotation
  SimilarityTransform result;
  result.rotation = quaternionToRotation(solver.eigenvectors().col(dominant));

  // 7. Isotropic scale
  if (adjust_scale) {
    const PositionMatrix rotated = floating_centered * result.rotation.transpose();
    const PositionMatrix corresponding_centered =
        corresponding.rowwise() - corresponding_centroid.transpose();
    const double numerator =
        weights.dot(rotated.cwiseProduct(corresponding_centered).rowwise().sum());
    const double denominator =
        weights.dot(rotated.rowwise().squaredNorm());
    result.scale = numerator / denominator;
    if (!(result.scale > 0.0)) {
      throw DegenerateState("RigidTransform",
                            "estimated scale " + std::to_string(result.scale) +
                                " is not positive");
    }
  }

  // 8. Translation between centroids
  result.translation = corresponding_centroid -
                       result.scale * result.rotation * floating_centroid;

  if (!result.rotation.allFinite() || !std::isfinite(result.scale) ||
      !result.translation.allFinite()) {
    throw DegenerateState("RigidTransform", "non-finite transform estimate");
  }
  return result;
}

Transform estimateAndApplyRigidTransform(
    Eigen::Ref<PositionMatrix> floating, const WeightVector& weights,
    const Eigen::Ref<const PositionMatrix>& corresponding, bool adjust_scale) {
  const Transform T =
      estimateRigidTransform(floating, corresponding, weights, adjust_scale)
          .matrix();
  applyTransform(floating, T);
  return T;
}

void applyTransform(Eigen::Ref<PositionMatrix> positions,
                    const Transform& transform) {
  const Eigen::Matrix3d A = transform.topLeftCorner<3, 3>();
  const Eigen::Vector3d t = transform.topRightCorner<3, 1>();
  const PositionMatrix moved = (positions * A.transpose()).rowwise() + t.transpose();
  positions = moved;
}

void applyTransform(FeatureMatrix& features, const Transform& transform) {
  applyTransform(features.leftCols<3>(), transform);

  // Normals only rotate; the positive scale is removed by renormalizing.
  const Eigen::Matrix3d A = transform.topLeftCorner<3, 3>();
  for (Eigen::Index i = 0; i < features.rows(); ++i) {
    Eigen::Vector3d normal = A * features.row(i).tail<3>().transpose();
    const double length = normal.norm();
    if (length > 0.0) normal /= length;
    features.row(i).tail<3>() = normal.transpose();
  }
}

}  // namespace meshreg
