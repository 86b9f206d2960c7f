// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <utility>
#include <vector>

#include "meshreg/exceptions.hpp"
#include "meshreg/search/kdtree_search.hpp"

using namespace meshreg;

namespace {

FeatureMatrix randomFeatures(int n, unsigned seed) {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<double> dist(-2.0, 2.0);
  FeatureMatrix f(n, kFeatureDim);
  for (int i = 0; i < n; ++i) {
    for (int d = 0; d < kFeatureDim; ++d) f(i, d) = dist(gen);
  }
  return f;
}

}  // namespace

TEST(KdTreeSearchTest, MatchesBruteForce) {
  const FeatureMatrix reference = randomFeatures(200, 7);
  const FeatureMatrix queries = randomFeatures(30, 8);
  const int k = 5;
  KdTreeSearch search;

  const NeighborQuery nn = search.knn(queries, reference, k);

  ASSERT_EQ(nn.distances.rows(), 30);
  ASSERT_EQ(nn.distances.cols(), k);
  ASSERT_EQ(nn.indices.rows(), 30);
  ASSERT_EQ(nn.indices.cols(), k);

  for (int i = 0; i < queries.rows(); ++i) {
    std::vector<std::pair<double, int>> all;
    for (int j = 0; j < reference.rows(); ++j) {
      all.emplace_back((reference.row(j) - queries.row(i)).norm(), j);
    }
    std::sort(all.begin(), all.end());

    for (int j = 0; j < k; ++j) {
      EXPECT_NEAR(nn.distances(i, j), all[j].first, 1e-12);
      EXPECT_EQ(nn.indices(i, j), all[j].second);
    }
  }
}

TEST(KdTreeSearchTest, DistancesAscending) {
  const FeatureMatrix reference = randomFeatures(50, 9);
  KdTreeSearch search(4);

  const NeighborQuery nn = search.knn(reference, reference, 4);

  for (int i = 0; i < reference.rows(); ++i) {
    for (int j = 1; j < 4; ++j) {
      EXPECT_LE(nn.distances(i, j - 1), nn.distances(i, j));
    }
  }
}

TEST(KdTreeSearchTest, SelfQueryFindsItself) {
  const FeatureMatrix reference = randomFeatures(40, 10);
  KdTreeSearch search;

  const NeighborQuery nn = search.knn(reference, reference, 1);

  for (int i = 0; i < reference.rows(); ++i) {
    EXPECT_EQ(nn.indices(i, 0), i);
    EXPECT_EQ(nn.distances(i, 0), 0.0);
  }
}

TEST(KdTreeSearchTest, NormalsContributeToDistance) {
  // Query shares the position of element 1 and the normal of element 0
  FeatureMatrix reference = FeatureMatrix::Zero(2, kFeatureDim);
  reference.row(0) << 0.0, 0.0, 0.0, 0.0, 0.0, 1.0;
  reference.row(1) << 0.05, 0.0, 0.0, 1.0, 0.0, 0.0;
  FeatureMatrix query = FeatureMatrix::Zero(1, kFeatureDim);
  query.row(0) << 0.05, 0.0, 0.0, 0.0, 0.0, 1.0;
  KdTreeSearch search;

  const NeighborQuery nn = search.knn(query, reference, 2);

  EXPECT_EQ(nn.indices(0, 0), 0);
  EXPECT_NEAR(nn.distances(0, 0), 0.05, 1e-12);
}

TEST(KdTreeSearchTest, WholeReferenceSet) {
  const FeatureMatrix reference = randomFeatures(6, 11);
  const FeatureMatrix queries = randomFeatures(3, 12);
  KdTreeSearch search;

  const NeighborQuery nn = search.knn(queries, reference, 6);

  for (int i = 0; i < 3; ++i) {
    std::vector<int> idx;
    for (int j = 0; j < 6; ++j) idx.push_back(nn.indices(i, j));
    std::sort(idx.begin(), idx.end());
    for (int j = 0; j < 6; ++j) EXPECT_EQ(idx[j], j);
  }
}

TEST(KdTreeSearchTest, InvalidArgumentsThrow) {
  const FeatureMatrix reference = randomFeatures(4, 13);
  const FeatureMatrix empty(0, kFeatureDim);
  KdTreeSearch search;

  EXPECT_THROW(search.knn(reference, reference, 0), InvalidArgument);
  EXPECT_THROW(search.knn(reference, reference, 5), InvalidArgument);
  EXPECT_THROW(search.knn(empty, reference, 1), InvalidArgument);
  EXPECT_THROW(search.knn(reference, empty, 1), InvalidArgument);
}
