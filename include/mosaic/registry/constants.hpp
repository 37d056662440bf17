#pragma once

#include <mosaic/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

namespace mosaic::registry {

inline constexpr auto kName = std::string_view{"Mosaic Layers"};
inline constexpr auto kSymbol = std::string_view{"MOSAIC"};

inline constexpr uint64_t kSupplyCap = 10'000;
inline constexpr mosaic::schema::token_id_t kFirstTokenId = 1;
inline constexpr uint32_t kMaxLayersPerArtifact = 32;
// Blocks a caller must wait between two successful mints.
inline constexpr mosaic::schema::block_height_t kMintCooldown = 18;
// 0.01 of the native currency at 18 decimals.
inline constexpr uint64_t kMintPriceBaseUnits = 10'000'000'000'000'000ull;

inline constexpr uint16_t kMaxRoyaltyBasisPoints = 1'000;
inline constexpr uint16_t kBasisPointsDenominator = 10'000;

// Interface identifiers answered by supports_interface.
inline constexpr uint32_t kInterfaceDiscoveryId = 0x01ffc9a7;
inline constexpr uint32_t kNonFungibleRegistryId = 0x80ac58cd;
inline constexpr uint32_t kRegistryMetadataId = 0x5b5e139f;
inline constexpr uint32_t kRoyaltyInfoId = 0x2a55205a;
inline constexpr uint32_t kInvalidInterfaceId = 0xffffffff;

inline mosaic::schema::amount_t mint_price() {
  return mosaic::schema::amount_t{kMintPriceBaseUnits};
}

}  // namespace mosaic::registry
