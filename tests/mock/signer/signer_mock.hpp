/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "signer/signer.hpp"

namespace attestor::signer {

  class SignerMock : public Signer {
   public:
    MOCK_METHOD(outcome::result<Felt>, publicKey, (), (override));

    MOCK_METHOD(outcome::result<Signature>,
                sign,
                (const InvokeTransactionV3 &,
                 const TransactionHash &,
                 const ChainId &),
                (override));
  };

}  // namespace attestor::signer
