// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_registration.hpp
 *
 * Iterative outlier-aware rigid registration of two feature sets.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_REGISTRATION_RIGID_REGISTRATION_HPP
#define MESHREG_REGISTRATION_RIGID_REGISTRATION_HPP

#include <memory>

#include "meshreg/config/meshreg.hpp"
#include "meshreg/search/neighbor_search.hpp"
#include "meshreg/types.hpp"

namespace meshreg {

/// Outcome of RigidRegistration::align().
struct RegistrationResult {
  Transform transform = Transform::Identity();  ///< Accumulated floating -> target
  int iterations = 0;                           ///< Iterations performed
  bool converged = false;  ///< Stopped by the step thresholds
  WeightVector inlier_probability;              ///< After the last iteration
};

/**
 * @brief Rigid (optionally similarity) registration driver.
 *
 * One iteration:
 *   1. affinity floating -> target (and target -> floating, fused, if
 *      correspondence.symmetric)
 *   2. corresponding features and flags of the target
 *   3. inlier probabilities (carried over between iterations)
 *   4. weighted transform with weights = inlier probability * floating flag,
 *      applied to the floating positions; normals are rotated
 *
 * Errors from any stage (InvalidArgument, DegenerateState) propagate.
 *
 * Usage:
 *   RigidRegistration reg(loadConfig("default.yaml"));
 *   auto result = reg.align(floating, target, floating_flags, target_flags);
 */
class RigidRegistration {
 public:
  /// Construct with default config and a KD-tree neighbour search
  RigidRegistration();

  explicit RigidRegistration(const Config& cfg);

  RigidRegistration(const Config& cfg, NeighborSearch::Ptr search);

  /// Replace the k-NN oracle
  RigidRegistration& setNeighborSearch(NeighborSearch::Ptr search);

  const Config& config() const noexcept { return cfg_; }

  /**
   * @brief Register @p floating onto @p target.
   *
   * @param floating Floating features, transformed in place
   * @param target Target features
   * @param floating_flags Validity of floating elements
   * @param target_flags Validity of target elements
   */
  RegistrationResult align(FeatureMatrix& floating, const FeatureMatrix& target,
                           const FlagVector& floating_flags,
                           const FlagVector& target_flags) const;

  /**
   * @brief Run a single registration iteration.
   *
   * @param inlier_probability In/out probabilities, one per floating element
   * @return Transform applied to @p floating in this iteration
   */
  Transform iterate(FeatureMatrix& floating, const FeatureMatrix& target,
                    const FlagVector& floating_flags,
                    const FlagVector& target_flags,
                    WeightVector& inlier_probability) const;

 private:
  Config cfg_;
  NeighborSearch::Ptr search_;
};

}  // namespace meshreg

#endif  // MESHREG_REGISTRATION_RIGID_REGISTRATION_HPP
