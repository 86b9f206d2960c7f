// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHREG_CONFIG_INLIER_HPP
#define MESHREG_CONFIG_INLIER_HPP

namespace meshreg::config {

/// Inlier/outlier classification.
struct Inlier {
  double kappa = 3.0;           ///< Outlier cut-off in units of sigma
  bool use_orientation = true;  ///< Down-weight normal disagreement
  double min_sigma = 1e-6;      ///< Floor for the re-estimated sigma
};

}  // namespace meshreg::config

#endif  // MESHREG_CONFIG_INLIER_HPP
