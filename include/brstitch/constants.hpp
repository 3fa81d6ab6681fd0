#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "brstitch/env.hpp"

namespace brstitch::constants {

inline constexpr std::size_t kHeaderSize = 128;
inline constexpr std::size_t kMagicSize = 3;
inline constexpr std::string_view kMagic = "BRS";
inline constexpr std::size_t kFlagsOffset = 3;
inline constexpr std::size_t kIndexOffset = 4;
inline constexpr std::size_t kNameOffset = 8;
inline constexpr std::size_t kNameCapacity = kHeaderSize - kNameOffset;

inline constexpr std::uint8_t kFlagLast = 0x01;
inline constexpr std::uint8_t kFlagCompressed = 0x02;
inline constexpr std::uint8_t kFlagMask = kFlagLast | kFlagCompressed;

inline constexpr std::string_view kSectionExt = ".brs";
inline constexpr std::string_view kNestSuffix = "_sections";

inline constexpr std::size_t kIoChunkSize = 64u << 10;
inline constexpr std::size_t kDefaultSectionSize = 8u << 20;

inline std::size_t DefaultSectionSize() {
    return brstitch::env::GetSize("BRSTITCH_SECTION_SIZE", kDefaultSectionSize);
}

inline std::size_t DefaultChunkSize() {
    return brstitch::env::GetSize("BRSTITCH_CHUNK_SIZE", kIoChunkSize);
}

}  // namespace brstitch::constants
