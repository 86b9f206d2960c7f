// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * correspondence.hpp
 *
 * Projection of target features and flags through an affinity matrix.
 */

#ifndef MESHREG_CORRESPONDENCE_CORRESPONDENCE_HPP
#define MESHREG_CORRESPONDENCE_CORRESPONDENCE_HPP

#include "meshreg/types.hpp"

namespace meshreg {

/// Corresponding features and binarized flags, one row per source element.
struct Correspondences {
  FeatureMatrix features;
  FlagVector flags;
};

/**
 * @brief Resolve soft correspondences.
 *
 * features = affinity · target_features
 * flags    = (affinity · target_flags > flag_threshold) ? 1 : 0
 *
 * The comparison is strict: a blended flag exactly at the threshold is 0.
 *
 * @throws InvalidArgument on mismatched shapes
 */
Correspondences resolveCorrespondences(const FeatureMatrix& target_features,
                                       const FlagVector& target_flags,
                                       const AffinityMatrix& affinity,
                                       double flag_threshold = 0.9);

}  // namespace meshreg

#endif  // MESHREG_CORRESPONDENCE_CORRESPONDENCE_HPP
