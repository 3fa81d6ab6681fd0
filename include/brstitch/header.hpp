#pragma once

#include "brstitch/constants.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace brstitch::header {

using HeaderBytes = std::array<std::uint8_t, constants::kHeaderSize>;

struct Header {
    std::string name;
    std::uint32_t index = 0;
    bool compressed = false;
    bool last = false;
};

// Layout: magic[3] | flags[1] | index u32 LE[4] | name[120], zero padded.
// Names longer than the name field are cut at the last whole UTF-8 code point that fits.
HeaderBytes Encode(std::string_view name, std::uint32_t index, bool compressed, bool last);
HeaderBytes Encode(const Header& header);

// Throws MalformedHeader.
Header Decode(const std::uint8_t* data, std::size_t len);
Header Decode(const HeaderBytes& bytes);

std::string TruncateName(std::string_view name);
bool IsValidUtf8(std::string_view text);

}  // namespace brstitch::header
