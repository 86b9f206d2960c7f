// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_rigid_transform.cpp
 *
 * Tests for weighted similarity estimation and transform application.
 */

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <cmath>
#include <limits>
#include <random>

#include "meshreg/exceptions.hpp"
#include "meshreg/transform/rigid_transform.hpp"

using namespace meshreg;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Eight points spanning all three axes.
PositionMatrix makeCloud() {
  PositionMatrix p(8, 3);
  p << 0.0, 0.0, 0.0,  //
      1.0, 0.0, 0.0,   //
      0.0, 2.0, 0.0,   //
      0.0, 0.0, 3.0,   //
      1.0, 1.0, 1.0,   //
      -1.0, 2.0, 0.5,  //
      2.0, -1.0, 1.5,  //
      0.5, 0.5, -1.0;
  return p;
}

PositionMatrix transformed(const PositionMatrix& p, const Eigen::Matrix3d& R,
                           double s, const Eigen::Vector3d& t) {
  PositionMatrix out = (s * p * R.transpose()).rowwise() + t.transpose();
  return out;
}

}  // namespace

class RigidTransformTest : public ::testing::Test {
 protected:
  PositionMatrix floating = makeCloud();
  WeightVector weights = WeightVector::Ones(8);
  Eigen::Matrix3d R =
      Eigen::AngleAxisd(0.7, Eigen::Vector3d(1.0, 2.0, 3.0).normalized())
          .toRotationMatrix();
  Eigen::Vector3d t{1.0, -2.0, 3.0};
};

// ─── Estimation ──────────────────────────────────────────────────────────────

TEST_F(RigidTransformTest, RecoversSimilarity) {
  const PositionMatrix target = transformed(floating, R, 2.5, t);

  const SimilarityTransform T =
      estimateRigidTransform(floating, target, weights, true);

  EXPECT_TRUE(T.rotation.isApprox(R, 1e-9));
  EXPECT_NEAR(T.scale, 2.5, 1e-9);
  EXPECT_TRUE(T.translation.isApprox(t, 1e-9));
}

TEST_F(RigidTransformTest, RecoversRigidMotion) {
  const PositionMatrix target = transformed(floating, R, 1.0, t);

  const SimilarityTransform T =
      estimateRigidTransform(floating, target, weights, false);

  EXPECT_TRUE(T.rotation.isApprox(R, 1e-9));
  EXPECT_EQ(T.scale, 1.0);
  EXPECT_TRUE(T.translation.isApprox(t, 1e-9));
  EXPECT_NEAR(T.rotation.determinant(), 1.0, 1e-12);
}

TEST_F(RigidTransformTest, IdenticalSetsGiveIdentity) {
  const SimilarityTransform T =
      estimateRigidTransform(floating, floating, weights, true);

  EXPECT_TRUE(T.rotation.isApprox(Eigen::Matrix3d::Identity(), 1e-12));
  EXPECT_NEAR(T.scale, 1.0, 1e-12);
  EXPECT_LT(T.translation.norm(), 1e-12);
}

TEST_F(RigidTransformTest, ScaleStaysOneWhenDisabled) {
  const PositionMatrix target = 3.0 * floating;

  const SimilarityTransform T =
      estimateRigidTransform(floating, target, weights, false);

  EXPECT_EQ(T.scale, 1.0);
  EXPECT_TRUE(T.rotation.isApprox(Eigen::Matrix3d::Identity(), 1e-12));

  const Eigen::Vector3d centroid = floating.colwise().mean().transpose();
  EXPECT_TRUE(T.translation.isApprox(2.0 * centroid, 1e-12));
}

TEST_F(RigidTransformTest, ZeroWeightElementsIgnored) {
  PositionMatrix src(10, 3), dst(10, 3);
  src.topRows(8) = floating;
  dst.topRows(8) = transformed(floating, R, 1.0, t);
  src.bottomRows(2) << 5.0, 5.0, 5.0, -4.0, 3.0, 2.0;
  dst.bottomRows(2) << 100.0, 0.0, 0.0, 0.0, -50.0, 7.0;
  WeightVector w = WeightVector::Ones(10);
  w.tail(2).setZero();

  const SimilarityTransform T = estimateRigidTransform(src, dst, w, false);

  EXPECT_TRUE(T.rotation.isApprox(R, 1e-9));
  EXPECT_TRUE(T.translation.isApprox(t, 1e-9));
}

TEST_F(RigidTransformTest, MatchesUmeyamaOnNoisyData) {
  std::mt19937 gen(42);
  std::normal_distribution<double> noise(0.0, 0.05);
  PositionMatrix target = transformed(floating, R, 1.7, t);
  for (int i = 0; i < target.rows(); ++i) {
    for (int d = 0; d < 3; ++d) target(i, d) += noise(gen);
  }

  const Transform T =
      estimateRigidTransform(floating, target, weights, true).matrix();
  const Eigen::Matrix4d reference =
      Eigen::umeyama(floating.transpose(), target.transpose(), true);

  EXPECT_TRUE(T.isApprox(reference, 1e-9));
}

TEST_F(RigidTransformTest, MatrixIsHomogeneous) {
  const PositionMatrix target = transformed(floating, R, 2.0, t);

  const Transform T =
      estimateRigidTransform(floating, target, weights, true).matrix();

  EXPECT_TRUE(T.row(3).isApprox(Eigen::RowVector4d(0, 0, 0, 1)));
  const Eigen::Matrix3d linear = T.topLeftCorner<3, 3>();
  const Eigen::Vector3d translation = T.topRightCorner<3, 1>();
  EXPECT_TRUE(linear.isApprox(2.0 * R, 1e-9));
  EXPECT_TRUE(translation.isApprox(t, 1e-9));
}

// ─── Degenerate Inputs ───────────────────────────────────────────────────────

TEST_F(RigidTransformTest, ZeroTotalWeightThrows) {
  weights.setZero();

  EXPECT_THROW(estimateRigidTransform(floating, floating, weights, false),
               DegenerateState);
}

TEST_F(RigidTransformTest, CollinearPointsThrow) {
  PositionMatrix line(5, 3);
  for (int i = 0; i < 5; ++i) line.row(i) << i, 2.0 * i, -1.0 * i;
  const WeightVector w = WeightVector::Ones(5);

  EXPECT_THROW(estimateRigidTransform(line, line, w, false), DegenerateState);
}

TEST_F(RigidTransformTest, SinglePositiveWeightThrows) {
  WeightVector w = WeightVector::Zero(8);
  w[3] = 1.0;

  EXPECT_THROW(estimateRigidTransform(floating, floating, w, false),
               DegenerateState);
}

TEST_F(RigidTransformTest, PlanarExactMatchIsAmbiguous) {
  // Noise-free coplanar points: the largest eigenvalue magnitude is shared
  // by +tr(C) and -tr(C), so the quaternion is not unique.
  PositionMatrix plane(4, 3);
  plane << 0.0, 0.0, 0.0,  //
      1.0, 0.0, 0.0,       //
      0.0, 2.0, 0.0,       //
      1.5, 1.0, 0.0;
  const WeightVector w = WeightVector::Ones(4);

  EXPECT_THROW(estimateRigidTransform(plane, plane, w, false), DegenerateState);
}

TEST_F(RigidTransformTest, PointReflectionScaleThrows) {
  // y = -x: the best rotation is the identity, leaving a scale of -1
  const PositionMatrix mirrored = -floating;

  EXPECT_THROW(estimateRigidTransform(floating, mirrored, weights, true),
               DegenerateState);

  const SimilarityTransform T =
      estimateRigidTransform(floating, mirrored, weights, false);
  EXPECT_EQ(T.scale, 1.0);
}

// ─── Argument Errors ─────────────────────────────────────────────────────────

TEST_F(RigidTransformTest, NegativeWeightThrows) {
  weights[2] = -0.1;

  EXPECT_THROW(estimateRigidTransform(floating, floating, weights, false),
               InvalidArgument);
}

TEST_F(RigidTransformTest, NonFiniteWeightThrows) {
  weights[0] = std::numeric_limits<double>::infinity();

  EXPECT_THROW(estimateRigidTransform(floating, floating, weights, false),
               InvalidArgument);
}

TEST_F(RigidTransformTest, LengthMismatchThrows) {
  const PositionMatrix shorter = floating.topRows(7);

  EXPECT_THROW(estimateRigidTransform(floating, shorter, weights, false),
               InvalidArgument);
  EXPECT_THROW(estimateRigidTransform(shorter, shorter, weights, false),
               InvalidArgument);
}

// ─── Application ─────────────────────────────────────────────────────────────

TEST_F(RigidTransformTest, EstimateAndApplyMovesFloatingInPlace) {
  const PositionMatrix target = transformed(floating, R, 1.3, t);

  const Transform T =
      estimateAndApplyRigidTransform(floating, weights, target, true);

  EXPECT_TRUE(floating.isApprox(target, 1e-9));
  EXPECT_TRUE(T.row(3).isApprox(Eigen::RowVector4d(0, 0, 0, 1)));
}

TEST_F(RigidTransformTest, EstimateAndApplyOnFeaturePositions) {
  FeatureMatrix features = FeatureMatrix::Zero(8, kFeatureDim);
  features.leftCols<3>() = floating;
  features.col(5).setOnes();
  const PositionMatrix target = transformed(floating, R, 1.0, t);

  estimateAndApplyRigidTransform(features.leftCols<3>(), weights, target,
                                 false);

  EXPECT_TRUE(features.leftCols<3>().isApprox(target, 1e-9));
  // Only the position block is touched
  EXPECT_TRUE(features.col(5).isOnes());
}

TEST(ApplyTransformTest, RotatesAndRenormalizesNormals) {
  Transform T = Transform::Identity();
  T.topLeftCorner<3, 3>() =
      2.0 * Eigen::AngleAxisd(M_PI / 2.0, Eigen::Vector3d::UnitZ())
                .toRotationMatrix();
  T.topRightCorner<3, 1>() << 0.0, 0.0, 1.0;

  FeatureMatrix features(2, kFeatureDim);
  features.row(0) << 1.0, 0.0, 0.0, 1.0, 0.0, 0.0;
  features.row(1) << 0.0, 1.0, 0.0, 0.0, 0.0, 0.0;

  applyTransform(features, T);

  EXPECT_NEAR(features(0, 0), 0.0, 1e-12);
  EXPECT_NEAR(features(0, 1), 2.0, 1e-12);
  EXPECT_NEAR(features(0, 2), 1.0, 1e-12);
  EXPECT_NEAR(features(0, 3), 0.0, 1e-12);
  EXPECT_NEAR(features(0, 4), 1.0, 1e-12);
  EXPECT_NEAR(features.row(0).tail<3>().norm(), 1.0, 1e-12);

  EXPECT_NEAR(features(1, 0), -2.0, 1e-12);
  // Zero normal stays zero
  EXPECT_EQ(features.row(1).tail<3>().norm(), 0.0);
}

TEST(ApplyTransformTest, PositionsOnly) {
  PositionMatrix p(2, 3);
  p << 1.0, 2.0, 3.0,  //
      -1.0, 0.0, 4.0;
  Transform T = Transform::Identity();
  T.topRightCorner<3, 1>() << 0.5, -0.5, 1.0;

  applyTransform(p, T);

  EXPECT_DOUBLE_EQ(p(0, 0), 1.5);
  EXPECT_DOUBLE_EQ(p(1, 1), -0.5);
  EXPECT_DOUBLE_EQ(p(1, 2), 5.0);
}
