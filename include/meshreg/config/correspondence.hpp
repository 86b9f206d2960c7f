// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHREG_CONFIG_CORRESPONDENCE_HPP
#define MESHREG_CONFIG_CORRESPONDENCE_HPP

namespace meshreg::config {

/// Soft correspondence search.
struct Correspondence {
  bool symmetric = true;        ///< Fuse forward and backward affinities
  int num_neighbours = 3;       ///< k of the k-NN affinity
  double flag_threshold = 0.9;  ///< Blended flag must exceed this to stay valid
};

}  // namespace meshreg::config

#endif  // MESHREG_CONFIG_CORRESPONDENCE_HPP
