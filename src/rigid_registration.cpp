// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_registration.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshreg/registration/rigid_registration.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "meshreg/correspondence/affinity.hpp"
#include "meshreg/correspondence/correspondence.hpp"
#include "meshreg/exceptions.hpp"
#include "meshreg/inlier/inlier_detection.hpp"
#include "meshreg/search/kdtree_search.hpp"
#include "meshreg/transform/rigid_transform.hpp"

namespace meshreg {

namespace {

/// Rotation angle [rad] of the rotation part of a similarity transform.
double rotationAngle(const Transform& T) {
  const Eigen::Matrix3d A = T.topLeftCorner<3, 3>();
  const double scale = A.col(0).norm();
  const double c = (A.trace() / scale - 1.0) / 2.0;
  return std::acos(std::clamp(c, -1.0, 1.0));
}

}  // namespace

RigidRegistration::RigidRegistration() : RigidRegistration(Config{}) {}

RigidRegistration::RigidRegistration(const Config& cfg)
    : RigidRegistration(cfg, std::make_shared<KdTreeSearch>()) {}

RigidRegistration::RigidRegistration(const Config& cfg,
                                     NeighborSearch::Ptr search)
    : cfg_(cfg), search_(std::move(search)) {
  if (!search_) {
    throw InvalidArgument("RigidRegistration", "neighbour search is null");
  }
}

RigidRegistration& RigidRegistration::setNeighborSearch(
    NeighborSearch::Ptr search) {
  if (!search) {
    throw InvalidArgument("RigidRegistration", "neighbour search is null");
  }
  search_ = std::move(search);
  return *this;
}

Transform RigidRegistration::iterate(FeatureMatrix& floating,
                                     const FeatureMatrix& target,
                                     const FlagVector& floating_flags,
                                     const FlagVector& target_flags,
                                     WeightVector& inlier_probability) const {
  const auto& cc = cfg_.correspondence;

  // 1. Soft correspondences
  AffinityMatrix affinity =
      computeAffinity(floating, target, cc.num_neighbours, *search_);
  if (cc.symmetric) {
    const AffinityMatrix backward =
        computeAffinity(target, floating, cc.num_neighbours, *search_);
    affinity = fuseAffinities(affinity, backward);
  }

  // 2. Corresponding features and flags
  const Correspondences corr = resolveCorrespondences(
      target, target_flags, affinity, cc.flag_threshold);

  // 3. Inlier probabilities
  const InlierStatistics stats = detectInliers(
      floating, corr.features, corr.flags, inlier_probability, cfg_.inlier);

  // 4. Weighted transform; invalid floating elements do not pull
  const WeightVector weights = inlier_probability.cwiseProduct(floating_flags);
  const Transform step =
      estimateRigidTransform(floating.leftCols<3>(), corr.features.leftCols<3>(),
                             weights, cfg_.transform.use_scaling)
          .matrix();
  applyTransform(floating, step);

  spdlog::debug("[RigidRegistration] sigma {:.6f}, mean inlier {:.4f}, "
                "step |t| {:.6f}, angle {:.6f}",
                stats.sigma, inlier_probability.mean(),
                step.topRightCorner<3, 1>().norm(), rotationAngle(step));
  return step;
}

RegistrationResult RigidRegistration::align(
    FeatureMatrix& floating, const FeatureMatrix& target,
    const FlagVector& floating_flags, const FlagVector& target_flags) const {
  if (floating_flags.size() != floating.rows()) {
    throw InvalidArgument("RigidRegistration",
                          "floating flags (" +
                              std::to_string(floating_flags.size()) +
                              ") and features (" +
                              std::to_string(floating.rows()) +
                              ") differ in length");
  }
  if (target_flags.size() != target.rows()) {
    throw InvalidArgument("RigidRegistration",
                          "target flags (" +
                              std::to_string(target_flags.size()) +
                              ") and features (" +
                              std::to_string(target.rows()) +
                              ") differ in length");
  }

  const auto& term = cfg_.termination;
  const bool early_stop = term.translation_eps > 0.0 || term.rotation_eps > 0.0;

  RegistrationResult result;
  result.inlier_probability = WeightVector::Ones(floating.rows());

  for (int iter = 0; iter < term.max_iterations; ++iter) {
    const Transform step = iterate(floating, target, floating_flags,
                                   target_flags, result.inlier_probability);
    result.transform = step * result.transform;
    result.iterations = iter + 1;

    // A zero threshold leaves its criterion out of the test
    const bool translation_small =
        term.translation_eps <= 0.0 ||
        step.topRightCorner<3, 1>().norm() < term.translation_eps;
    const bool rotation_small =
        term.rotation_eps <= 0.0 || rotationAngle(step) < term.rotation_eps;
    if (early_stop && translation_small && rotation_small) {
      result.converged = true;
      break;
    }
  }

  spdlog::info("[RigidRegistration] {} iterations{}, {} of {} elements inlier "
               "(p > 0.5)",
               result.iterations, result.converged ? " (converged)" : "",
               (result.inlier_probability.array() > 0.5).count(),
               floating.rows());
  return result;
}

}  // namespace meshreg
