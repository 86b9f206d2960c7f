// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * inlier_detection.hpp
 *
 * Per-element inlier probability from flags, a Gaussian/uniform residual
 * mixture, and normal agreement.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_INLIER_INLIER_DETECTION_HPP
#define MESHREG_INLIER_INLIER_DETECTION_HPP

#include "meshreg/config/inlier.hpp"
#include "meshreg/types.hpp"

namespace meshreg {

/// Mixture-model statistics of one classification pass.
struct InlierStatistics {
  double sigma = 0.0;   ///< Weighted RMS residual (after flooring)
  double lambda = 0.0;  ///< Outlier density level at kappa * sigma
};

/**
 * @brief Update inlier probabilities in place.
 *
 * Three sequential passes:
 *   1. Flag gate: corresponding_flags[i] < 0.5 forces probability[i] to 0.
 *   2. Residual mixture: sigma = sqrt(Σ p·d² / Σ p) using the probabilities
 *      after pass 1, lambda = N(kappa·sigma; 0, sigma), and
 *      p_i = g_i / (g_i + lambda) with g_i = N(d_i; 0, sigma). d_i is the
 *      distance over the full 6-D feature. One re-estimation step only.
 *   3. Orientation (config.use_orientation): p_i *= dot(n_i, n'_i) / 2 + 0.5.
 *
 * sigma is floored at config.min_sigma, so a perfect match keeps finite
 * probabilities.
 *
 * Elements zeroed by the flag gate stay at 0.
 *
 * @param features Floating features (N rows)
 * @param corresponding_features Corresponding features (N rows)
 * @param corresponding_flags Binarized corresponding flags (N)
 * @param probability In/out inlier probabilities (N), values in [0, 1]
 * @throws InvalidArgument on length mismatch
 * @throws DegenerateState if every probability is 0 after the flag gate
 */
InlierStatistics detectInliers(const FeatureMatrix& features,
                               const FeatureMatrix& corresponding_features,
                               const FlagVector& corresponding_flags,
                               WeightVector& probability,
                               const config::Inlier& config = {});

}  // namespace meshreg

#endif  // MESHREG_INLIER_INLIER_DETECTION_HPP
