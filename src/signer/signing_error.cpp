/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signer/signing_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::signer, SigningError, e) {
  using E = attestor::signer::SigningError;
  switch (e) {
    case E::SIGNER_UNAVAILABLE:
      return "Signer is unavailable";
    case E::MALFORMED_RESPONSE:
      return "Signer returned a malformed response";
    case E::INVALID_KEY:
      return "Invalid signing key";
    case E::MESSAGE_HASH_OUT_OF_RANGE:
      return "Message hash is out of the signable range";
  }
  return "Unknown SigningError";
}
