// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * affinity.hpp
 *
 * Soft correspondence (affinity) construction and fusion.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_CORRESPONDENCE_AFFINITY_HPP
#define MESHREG_CORRESPONDENCE_AFFINITY_HPP

#include "meshreg/search/neighbor_search.hpp"
#include "meshreg/types.hpp"

namespace meshreg {

/// Distances below this are clamped before inversion.
constexpr double kMinAffinityDistance = 0.001;

/// Affinity weights below this are clamped before row normalization.
constexpr double kMinAffinityWeight = 0.0001;

/**
 * @brief Build a row-stochastic affinity from k-NN distances.
 *
 * For each source element, the k nearest target elements receive weight
 * 1 / max(d, kMinAffinityDistance)^2 (floored at kMinAffinityWeight); the row
 * is then normalized to sum to 1. All other entries are exactly 0.
 *
 * If all k neighbours lie at the floor distance the row becomes uniform 1/k.
 *
 * @param source Features to find correspondences for (N_source rows)
 * @param target Features to correspond to (N_target rows)
 * @param k Number of neighbours, 1 <= k <= N_target
 * @param search k-NN oracle
 * @return Affinity of shape (N_source, N_target)
 * @throws InvalidArgument if k is out of range or a set is empty
 */
AffinityMatrix computeAffinity(const FeatureMatrix& source,
                               const FeatureMatrix& target, int k,
                               const NeighborSearch& search);

/**
 * @brief Fuse a forward and an independently computed backward affinity.
 *
 * fused = row_normalize(affinity12 + affinity21ᵀ)
 *
 * @param affinity12 Forward affinity, shape (N1, N2)
 * @param affinity21 Backward affinity, shape (N2, N1)
 * @return Fused row-stochastic affinity, shape (N1, N2)
 * @throws InvalidArgument if the shapes are not transposed of each other
 */
AffinityMatrix fuseAffinities(const AffinityMatrix& affinity12,
                              const AffinityMatrix& affinity21);

/// Scale every row to sum to 1. Throws DegenerateState on a zero row.
void normalizeRows(AffinityMatrix& affinity);

}  // namespace meshreg

#endif  // MESHREG_CORRESPONDENCE_AFFINITY_HPP
