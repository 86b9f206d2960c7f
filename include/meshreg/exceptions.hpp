// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * exceptions.hpp
 *
 * Exception hierarchy for registration errors.
 *
 *   RegistrationError (base)
 *   ├── InvalidArgument - malformed shapes, parameters out of range
 *   └── DegenerateState - zero weight sums, undefined variance, ambiguous
 *                         or underdetermined rotation
 *
 * Every error carries the name of the module that raised it:
 *   throw DegenerateState("RigidTransform", "total weight is zero");
 *   // what(): "[RigidTransform] total weight is zero"
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHREG_EXCEPTIONS_HPP
#define MESHREG_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace meshreg {

/**
 * @brief Base exception for registration errors
 */
class RegistrationError : public std::runtime_error {
 public:
  RegistrationError(const std::string& module, const std::string& message)
      : std::runtime_error("[" + module + "] " + message),
        module_(module),
        message_(message) {}

  const std::string& getModule() const { return module_; }
  const std::string& getMessage() const { return message_; }

 private:
  std::string module_;
  std::string message_;
};

/**
 * @brief Input violates a precondition (shape mismatch, k out of range).
 */
class InvalidArgument : public RegistrationError {
 public:
  InvalidArgument(const std::string& module, const std::string& message)
      : RegistrationError(module, message) {}
};

/**
 * @brief Inputs are well-formed but the estimate is undefined.
 *
 * Examples:
 * - All weights (or inlier probabilities) are zero
 * - Weighted points are collinear
 * - Dominant eigenvalue of the quaternion matrix is not unique
 * - NaN/Inf survived the numeric floors
 */
class DegenerateState : public RegistrationError {
 public:
  DegenerateState(const std::string& module, const std::string& message)
      : RegistrationError(module, message) {}
};

}  // namespace meshreg

#endif  // MESHREG_EXCEPTIONS_HPP
