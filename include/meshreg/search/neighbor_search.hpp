// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * neighbor_search.hpp
 *
 * k-nearest-neighbour search interface between two feature sets.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_SEARCH_NEIGHBOR_SEARCH_HPP
#define MESHREG_SEARCH_NEIGHBOR_SEARCH_HPP

#include <Eigen/Core>
#include <memory>

#include "meshreg/types.hpp"

namespace meshreg {

/// Result of a batched k-NN query. Row i holds the k neighbours of query i.
struct NeighborQuery {
  Eigen::MatrixXd distances;  ///< Euclidean distances, ascending per row
  Eigen::MatrixXi indices;    ///< Row indices into the reference set
};

/**
 * @brief Abstract k-NN oracle.
 *
 * For each row of @p queries, returns the @p k nearest rows of @p reference
 * and their Euclidean distances over the full feature vector.
 * Implementations throw InvalidArgument if k < 1, k > reference.rows() or
 * either set is empty.
 */
class NeighborSearch {
 public:
  using Ptr = std::shared_ptr<const NeighborSearch>;

  virtual ~NeighborSearch() = default;

  virtual NeighborQuery knn(const FeatureMatrix& queries,
                            const FeatureMatrix& reference, int k) const = 0;
};

}  // namespace meshreg

#endif  // MESHREG_SEARCH_NEIGHBOR_SEARCH_HPP
