/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "types/types.hpp"

namespace attestor::app {

  /// Well-known deployment of the staking protocol
  struct NetworkPreset {
    std::string_view name;
    std::string_view chain_id;
    std::string_view staking_contract;
    std::string_view attestation_contract;
    std::string_view strk_token;
  };

  inline constexpr NetworkPreset kSepolia{
      .name = "sepolia",
      .chain_id = "SN_SEPOLIA",
      .staking_contract =
          "0x034370fc9931c636ab07b16ada82d60f05d32993943debe2376847e0921c1162",
      .attestation_contract =
          "0x04862e05d00f2d0981c4a912269c21ad99438598ab86b6e70d1cee267caaa78d",
      .strk_token =
          "0x04718f5a0fc34cc1af16a1cdee98ffb20c31f5cd61d6ab07201858f4287c938d",
  };

  inline constexpr NetworkPreset kMainnet{
      .name = "mainnet",
      .chain_id = "SN_MAIN",
      .staking_contract =
          "0x00ca1702e64c81d9a07b86bd2c540188d92a2c73cf5cc0e508d949015e7e84a7",
      .attestation_contract =
          "0x010398fe631af9ab2311840432d507bf7ef4b959ae967f1507928f5afe888a99",
      .strk_token =
          "0x04718f5a0fc34cc1af16a1cdee98ffb20c31f5cd61d6ab07201858f4287c938d",
  };

  inline std::optional<NetworkPreset> networkPreset(std::string_view name) {
    for (auto &preset : {kSepolia, kMainnet}) {
      if (preset.name == name) {
        return preset;
      }
    }
    return std::nullopt;
  }

}  // namespace attestor::app
