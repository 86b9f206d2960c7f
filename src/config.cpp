// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "meshreg/config/meshreg.hpp"

namespace meshreg {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["correspondences"]) {
    load(n, "symmetric", cfg.correspondence.symmetric);
    load(n, "num_neighbours", cfg.correspondence.num_neighbours);
    load(n, "flag_threshold", cfg.correspondence.flag_threshold);
  }

  if (auto n = root["inliers"]) {
    load(n, "kappa", cfg.inlier.kappa);
    load(n, "use_orientation", cfg.inlier.use_orientation);
    load(n, "min_sigma", cfg.inlier.min_sigma);
  }

  if (auto n = root["transform"]) {
    load(n, "use_scaling", cfg.transform.use_scaling);
  }

  if (auto n = root["registration"]) {
    load(n, "max_iterations", cfg.termination.max_iterations);
    load(n, "translation_eps", cfg.termination.translation_eps);
    load(n, "rotation_eps", cfg.termination.rotation_eps);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: no meaningful value to fall back to ---
  if (cfg.correspondence.num_neighbours < 1) {
    throw std::invalid_argument(
        "correspondences.num_neighbours (" +
        std::to_string(cfg.correspondence.num_neighbours) + ") must be >= 1");
  }

  // --- Non-fatal: warn and clamp ---
  auto& c = cfg.correspondence;
  if (c.flag_threshold < 0.0 || c.flag_threshold > 1.0) {
    spdlog::warn("[Config] correspondences.flag_threshold ({}) out of [0, 1], "
                 "clamping",
                 c.flag_threshold);
    c.flag_threshold = std::clamp(c.flag_threshold, 0.0, 1.0);
  }

  auto& in = cfg.inlier;
  if (!(in.kappa > 0.0)) {
    spdlog::warn("[Config] inliers.kappa ({}) must be > 0, clamping to 3.0",
                 in.kappa);
    in.kappa = 3.0;
  }
  if (!(in.min_sigma > 0.0)) {
    spdlog::warn("[Config] inliers.min_sigma ({}) must be > 0, clamping to 1e-6",
                 in.min_sigma);
    in.min_sigma = 1e-6;
  }

  auto& t = cfg.termination;
  if (t.max_iterations < 1) {
    spdlog::warn("[Config] registration.max_iterations ({}) must be >= 1, "
                 "clamping to 1",
                 t.max_iterations);
    t.max_iterations = 1;
  }
  if (t.translation_eps < 0.0) {
    spdlog::warn("[Config] registration.translation_eps ({}) must be >= 0, "
                 "clamping to 0",
                 t.translation_eps);
    t.translation_eps = 0.0;
  }
  if (t.rotation_eps < 0.0) {
    spdlog::warn("[Config] registration.rotation_eps ({}) must be >= 0, "
                 "clamping to 0",
                 t.rotation_eps);
    t.rotation_eps = 0.0;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace meshreg
