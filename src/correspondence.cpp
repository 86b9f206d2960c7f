// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshreg/correspondence/correspondence.hpp"

#include <string>

#include "meshreg/exceptions.hpp"

namespace meshreg {

Correspondences resolveCorrespondences(const FeatureMatrix& target_features,
                                       const FlagVector& target_flags,
                                       const AffinityMatrix& affinity,
                                       double flag_threshold) {
  if (affinity.cols() != target_features.rows()) {
    throw InvalidArgument("Correspondence",
                          "affinity has " + std::to_string(affinity.cols()) +
                              " columns but target has " +
                              std::to_string(target_features.rows()) +
                              " features");
  }
  if (target_flags.size() != target_features.rows()) {
    throw InvalidArgument("Correspondence",
                          "target flags and features differ in length");
  }

  Correspondences out;
  out.features = affinity * target_features;
  out.flags = affinity * target_flags;

  for (Eigen::Index i = 0; i < out.flags.size(); ++i) {
    out.flags[i] = (out.flags[i] > flag_threshold) ? 1.0 : 0.0;
  }
  return out;
}

}  // namespace meshreg
