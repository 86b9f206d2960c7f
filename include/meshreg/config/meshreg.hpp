// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHREG_CONFIG_MESHREG_HPP
#define MESHREG_CONFIG_MESHREG_HPP

#include <string>

namespace YAML {
class Node;
}

#include "meshreg/config/correspondence.hpp"
#include "meshreg/config/inlier.hpp"

namespace meshreg {

namespace config {

/// Transform model estimated per iteration.
struct RigidTransform {
  bool use_scaling = false;  ///< Estimate an isotropic scale as well
};

/// Iteration control of the registration driver.
struct Termination {
  int max_iterations = 80;
  double translation_eps = 0.0;  ///< Stop below this step translation (0: off)
  double rotation_eps = 0.0;     ///< Stop below this step rotation [rad] (0: off)
};

}  // namespace config

/// Rigid registration configuration.
struct Config {
  config::Correspondence correspondence;
  config::Inlier inlier;
  config::RigidTransform transform;
  config::Termination termination;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace meshreg

#endif  // MESHREG_CONFIG_MESHREG_HPP
