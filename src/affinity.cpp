// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * affinity.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshreg/correspondence/affinity.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "meshreg/exceptions.hpp"

namespace meshreg {

AffinityMatrix computeAffinity(const FeatureMatrix& source,
                               const FeatureMatrix& target, int k,
                               const NeighborSearch& search) {
  if (source.rows() == 0 || target.rows() == 0) {
    throw InvalidArgument("Affinity", "feature sets must not be empty");
  }
  if (k < 1 || k > target.rows()) {
    throw InvalidArgument("Affinity", "k (" + std::to_string(k) +
                                          ") must be in [1, " +
                                          std::to_string(target.rows()) + "]");
  }

  const NeighborQuery nn = search.knn(source, target, k);
  if (nn.distances.rows() != source.rows() || nn.distances.cols() != k ||
      nn.indices.rows() != source.rows() || nn.indices.cols() != k) {
    throw InvalidArgument("Affinity", "neighbour search returned wrong shape");
  }

  std::vector<Eigen::Triplet<double>> triplets;
  triplets.reserve(static_cast<size_t>(source.rows()) * k);

  for (Eigen::Index i = 0; i < source.rows(); ++i) {
    for (int j = 0; j < k; ++j) {
      const int idx = nn.indices(i, j);
      if (idx < 0 || idx >= target.rows()) {
        throw InvalidArgument("Affinity", "neighbour index " +
                                              std::to_string(idx) +
                                              " out of range");
      }

      const double distance = std::max(nn.distances(i, j), kMinAffinityDistance);
      const double weight =
          std::max(1.0 / (distance * distance), kMinAffinityWeight);
      if (!std::isfinite(weight)) {
        throw DegenerateState("Affinity", "non-finite neighbour distance for "
                                          "element " + std::to_string(i));
      }
      triplets.emplace_back(static_cast<int>(i), idx, weight);
    }
  }

  AffinityMatrix affinity(source.rows(), target.rows());
  // A repeated neighbour keeps its last weight rather than accumulating.
  affinity.setFromTriplets(triplets.begin(), triplets.end(),
                           [](const double&, const double& b) { return b; });
  normalizeRows(affinity);
  return affinity;
}

AffinityMatrix fuseAffinities(const AffinityMatrix& affinity12,
                              const AffinityMatrix& affinity21) {
  if (affinity21.rows() != affinity12.cols() ||
      affinity21.cols() != affinity12.rows()) {
    throw InvalidArgument(
        "Affinity", "backward affinity must be (" +
                        std::to_string(affinity12.cols()) + " x " +
                        std::to_string(affinity12.rows()) + "), got (" +
                        std::to_string(affinity21.rows()) + " x " +
                        std::to_string(affinity21.cols()) + ")");
  }

  // Evaluate the transpose into row-major storage before summing.
  const AffinityMatrix backward = affinity21.transpose();
  AffinityMatrix fused = affinity12 + backward;
  normalizeRows(fused);
  return fused;
}

void normalizeRows(AffinityMatrix& affinity) {
  for (Eigen::Index row = 0; row < affinity.outerSize(); ++row) {
    double sum = 0.0;
    for (AffinityMatrix::InnerIterator it(affinity, row); it; ++it) {
      sum += it.value();
    }
    if (!(sum > 0.0) || !std::isfinite(sum)) {
      throw DegenerateState("Affinity", "row " + std::to_string(row) +
                                            " has no positive weight");
    }
    for (AffinityMatrix::InnerIterator it(affinity, row); it; ++it) {
      it.valueRef() /= sum;
    }
  }
}

}  // namespace meshreg
