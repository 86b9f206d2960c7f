// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kdtree_search.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshreg/search/kdtree_search.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <nanoflann.hpp>
#include <string>
#include <vector>

#include "meshreg/exceptions.hpp"

namespace meshreg {

namespace {

struct FeatureAdaptor {
  const FeatureMatrix* features;

  explicit FeatureAdaptor(const FeatureMatrix* f) : features(f) {}

  size_t kdtree_get_point_count() const {
    return static_cast<size_t>(features->rows());
  }
  double kdtree_get_pt(size_t idx, size_t dim) const {
    return (*features)(static_cast<Eigen::Index>(idx),
                       static_cast<Eigen::Index>(dim));
  }
  template <class BBOX>
  bool kdtree_get_bbox(BBOX&) const {
    return false;
  }
};

using FeatureKdTree = nanoflann::KDTreeSingleIndexAdaptor<
    nanoflann::L2_Simple_Adaptor<double, FeatureAdaptor>,
    FeatureAdaptor,
    kFeatureDim,
    uint32_t>;

}  // namespace

void checkKnnArguments(const FeatureMatrix& queries,
                       const FeatureMatrix& reference, int k) {
  if (queries.rows() == 0 || reference.rows() == 0) {
    throw InvalidArgument("NeighborSearch", "feature sets must not be empty");
  }
  if (k < 1 || k > reference.rows()) {
    throw InvalidArgument("NeighborSearch",
                          "k (" + std::to_string(k) + ") must be in [1, " +
                              std::to_string(reference.rows()) + "]");
  }
}

KdTreeSearch::KdTreeSearch(int leaf_max_size)
    : leaf_max_size_(leaf_max_size) {}

NeighborQuery KdTreeSearch::knn(const FeatureMatrix& queries,
                                const FeatureMatrix& reference, int k) const {
  checkKnnArguments(queries, reference, k);

  FeatureAdaptor adaptor(&reference);
  FeatureKdTree index(kFeatureDim, adaptor,
                      nanoflann::KDTreeSingleIndexAdaptorParams(
                          static_cast<size_t>(leaf_max_size_)));

  const Eigen::Index n = queries.rows();
  NeighborQuery result;
  result.distances.resize(n, k);
  result.indices.resize(n, k);

  std::vector<uint32_t> idx(static_cast<size_t>(k));
  std::vector<double> dist_sq(static_cast<size_t>(k));
  std::array<double, kFeatureDim> query{};

  for (Eigen::Index i = 0; i < n; ++i) {
    for (int d = 0; d < kFeatureDim; ++d) query[d] = queries(i, d);

    const size_t found =
        index.knnSearch(query.data(), static_cast<size_t>(k), idx.data(),
                        dist_sq.data());
    if (found != static_cast<size_t>(k)) {
      throw DegenerateState("NeighborSearch",
                            "found " + std::to_string(found) + " of " +
                                std::to_string(k) + " neighbours for query " +
                                std::to_string(i));
    }

    for (int j = 0; j < k; ++j) {
      result.indices(i, j) = static_cast<int>(idx[j]);
      result.distances(i, j) = std::sqrt(dist_sq[j]);
    }
  }

  return result;
}

}  // namespace meshreg
