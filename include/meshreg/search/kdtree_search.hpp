// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kdtree_search.hpp
 *
 * KD-tree k-NN search over 6-D features (nanoflann backend).
 */

#ifndef MESHREG_SEARCH_KDTREE_SEARCH_HPP
#define MESHREG_SEARCH_KDTREE_SEARCH_HPP

#include "meshreg/search/neighbor_search.hpp"

namespace meshreg {

/**
 * @brief KD-tree oracle. The tree is rebuilt over @p reference on every call,
 * since the floating set moves between registration iterations.
 */
class KdTreeSearch : public NeighborSearch {
 public:
  explicit KdTreeSearch(int leaf_max_size = 10);

  NeighborQuery knn(const FeatureMatrix& queries,
                    const FeatureMatrix& reference, int k) const override;

 private:
  int leaf_max_size_;
};

/// Validate a k-NN request; shared by all oracle implementations.
void checkKnnArguments(const FeatureMatrix& queries,
                       const FeatureMatrix& reference, int k);

}  // namespace meshreg

#endif  // MESHREG_SEARCH_KDTREE_SEARCH_HPP
