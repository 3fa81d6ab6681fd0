#include "brstitch/header.hpp"

#include "brstitch/errors.hpp"

#include <cstring>

namespace brstitch::header {

namespace {

void WriteU32Le(std::uint8_t* out, std::uint32_t value) {
    out[0] = static_cast<std::uint8_t>(value & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
}

std::uint32_t ReadU32Le(const std::uint8_t* ptr) {
    return static_cast<std::uint32_t>(ptr[0])
        | (static_cast<std::uint32_t>(ptr[1]) << 8)
        | (static_cast<std::uint32_t>(ptr[2]) << 16)
        | (static_cast<std::uint32_t>(ptr[3]) << 24);
}

bool IsContinuation(unsigned char ch) {
    return (ch & 0xC0) == 0x80;
}

// Length of the sequence introduced by lead, 0 when lead cannot start one.
std::size_t SequenceLength(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

}  // namespace

bool IsValidUtf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        std::size_t len = SequenceLength(lead);
        if (len == 0 || i + len > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            if (!IsContinuation(static_cast<unsigned char>(text[i + k]))) {
                return false;
            }
        }
        if (len >= 3) {
            unsigned char second = static_cast<unsigned char>(text[i + 1]);
            // Overlong forms, UTF-16 surrogates and code points above U+10FFFF.
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F)
                || (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

std::string TruncateName(std::string_view name) {
    if (name.size() <= constants::kNameCapacity) {
        return std::string(name);
    }
    std::size_t cut = constants::kNameCapacity;
    while (cut > 0 && IsContinuation(static_cast<unsigned char>(name[cut]))) {
        --cut;
    }
    return std::string(name.substr(0, cut));
}

HeaderBytes Encode(std::string_view name, std::uint32_t index, bool compressed, bool last) {
    HeaderBytes out{};
    std::memcpy(out.data(), constants::kMagic.data(), constants::kMagicSize);
    std::uint8_t flags = 0;
    if (last) {
        flags |= constants::kFlagLast;
    }
    if (compressed) {
        flags |= constants::kFlagCompressed;
    }
    out[constants::kFlagsOffset] = flags;
    WriteU32Le(out.data() + constants::kIndexOffset, index);
    std::string stored = TruncateName(name);
    if (!stored.empty()) {
        std::memcpy(out.data() + constants::kNameOffset, stored.data(), stored.size());
    }
    return out;
}

HeaderBytes Encode(const Header& header) {
    return Encode(header.name, header.index, header.compressed, header.last);
}

Header Decode(const std::uint8_t* data, std::size_t len) {
    if (len != constants::kHeaderSize) {
        throw MalformedHeader("expected " + std::to_string(constants::kHeaderSize) + " bytes, got "
                              + std::to_string(len));
    }
    if (std::memcmp(data, constants::kMagic.data(), constants::kMagicSize) != 0) {
        throw MalformedHeader("bad magic");
    }
    std::uint8_t flags = data[constants::kFlagsOffset];
    if ((flags & ~constants::kFlagMask) != 0) {
        throw MalformedHeader("unknown flag bits set");
    }

    Header header;
    header.last = (flags & constants::kFlagLast) != 0;
    header.compressed = (flags & constants::kFlagCompressed) != 0;
    header.index = ReadU32Le(data + constants::kIndexOffset);

    const char* name_begin = reinterpret_cast<const char*>(data + constants::kNameOffset);
    std::size_t name_len = constants::kNameCapacity;
    while (name_len > 0 && name_begin[name_len - 1] == '\0') {
        --name_len;
    }
    std::string_view name(name_begin, name_len);
    if (!IsValidUtf8(name)) {
        throw MalformedHeader("name is not valid UTF-8");
    }
    header.name.assign(name.begin(), name.end());
    return header;
}

Header Decode(const HeaderBytes& bytes) {
    return Decode(bytes.data(), bytes.size());
}

}  // namespace brstitch::header
