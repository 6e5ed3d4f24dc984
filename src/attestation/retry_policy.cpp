/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/retry_policy.hpp"

#include <algorithm>

#include "attestation/window_evaluator.hpp"

namespace attestor::attestation {

  // Signer errors stay transient, a remote signer may recover its key
  ErrorClass RetryPolicy::classify(const std::error_code &error) {
    if (error == WindowError::EMPTY_ASSIGNMENT_RANGE) {
      return ErrorClass::Terminal;
    }
    return ErrorClass::Transient;
  }

  RetryPolicy::Duration RetryPolicy::delay(size_t attempt) const {
    auto delay = initial_backoff_;
    for (size_t i = 0; i < attempt and delay < max_backoff_; ++i) {
      delay *= 2;
    }
    return std::min(delay, max_backoff_);
  }

}  // namespace attestor::attestation
