// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * meshreg.hpp
 *
 * meshreg: outlier-aware rigid registration of surface feature sets.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_MESHREG_HPP
#define MESHREG_MESHREG_HPP

// Configs
#include "meshreg/config/meshreg.hpp"

// Data types and errors
#include "meshreg/exceptions.hpp"
#include "meshreg/types.hpp"

// Pipeline stages
#include "meshreg/correspondence/affinity.hpp"
#include "meshreg/correspondence/correspondence.hpp"
#include "meshreg/inlier/inlier_detection.hpp"
#include "meshreg/search/kdtree_search.hpp"
#include "meshreg/search/neighbor_search.hpp"
#include "meshreg/transform/rigid_transform.hpp"

// Driver
#include "meshreg/registration/rigid_registration.hpp"

#endif  // MESHREG_MESHREG_HPP
