/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/impl/window_evaluator_impl.hpp"

#include <algorithm>
#include <array>

#include "crypto/poseidon.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::attestation, WindowError, e) {
  using E = attestor::attestation::WindowError;
  switch (e) {
    case E::EMPTY_ASSIGNMENT_RANGE:
      return "Attestation window is not shorter than the epoch";
  }
  return "Unknown WindowError";
}

namespace attestor::attestation {

  outcome::result<AttestationWindow> WindowEvaluatorImpl::evaluate(
      const AttestationInfo &info) const {
    const auto &epoch = info.epoch;
    if (epoch.length <= info.attestation_window) {
      return WindowError::EMPTY_ASSIGNMENT_RANGE;
    }
    const uint64_t range = epoch.length - info.attestation_window;

    std::array<Felt, 3> input{
        info.stake,
        Felt{epoch.id},
        info.staker_address,
    };
    auto hash = crypto::poseidonHashMany(input);
    auto offset = static_cast<uint64_t>(uint256_t{hash.value() % range});

    AttestationWindow window;
    window.assigned_block = epoch.starting_block + offset;
    window.window_end = std::min(window.assigned_block + info.attestation_window,
                                 epoch.endBlock());
    return window;
  }

}  // namespace attestor::attestation
