#include "brstitch/transform.hpp"

#include "brstitch/errors.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

#include <zlib.h>

namespace brstitch::transform {

namespace {

constexpr std::size_t kOutBufferSize = 1u << 16;

// zlib counts in uInt; larger inputs are fed in slices.
constexpr std::size_t kMaxZlibSlice = std::numeric_limits<uInt>::max();

std::string ZlibMessage(const z_stream& zs, int rc) {
    if (zs.msg) {
        return std::string(zs.msg);
    }
    return "zlib error " + std::to_string(rc);
}

}  // namespace

void IdentityTransform::Feed(const std::uint8_t* data, std::size_t len, Bytes& out) {
    if (len > 0) {
        out.insert(out.end(), data, data + len);
    }
}

void IdentityTransform::Finish(Bytes&) {}

struct DeflateTransform::State {
    z_stream zs{};
    std::array<std::uint8_t, kOutBufferSize> buffer{};
};

DeflateTransform::DeflateTransform(int level) : state_(std::make_unique<State>()) {
    if (deflateInit(&state_->zs, level) != Z_OK) {
        throw std::runtime_error("Failed to initialize deflate stream");
    }
}

DeflateTransform::~DeflateTransform() {
    deflateEnd(&state_->zs);
}

void DeflateTransform::Run(const std::uint8_t* data, std::size_t len, int flush, Bytes& out) {
    z_stream& zs = state_->zs;
    std::size_t offset = 0;
    do {
        std::size_t slice = std::min(len - offset, kMaxZlibSlice);
        bool final_slice = offset + slice == len;
        int mode = final_slice ? flush : Z_NO_FLUSH;
        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data + offset));
        zs.avail_in = static_cast<uInt>(slice);
        int rc = Z_OK;
        do {
            zs.next_out = state_->buffer.data();
            zs.avail_out = static_cast<uInt>(state_->buffer.size());
            rc = deflate(&zs, mode);
            if (rc == Z_STREAM_ERROR) {
                throw std::runtime_error("Deflate failed: " + ZlibMessage(zs, rc));
            }
            std::size_t produced = state_->buffer.size() - zs.avail_out;
            out.insert(out.end(), state_->buffer.begin(),
                       state_->buffer.begin() + static_cast<std::ptrdiff_t>(produced));
        } while (zs.avail_out == 0 || (mode == Z_FINISH && rc != Z_STREAM_END));
        offset += slice;
    } while (offset < len);
}

void DeflateTransform::Feed(const std::uint8_t* data, std::size_t len, Bytes& out) {
    if (finished_) {
        throw std::logic_error("DeflateTransform::Feed after Finish");
    }
    if (len == 0) {
        return;
    }
    Run(data, len, Z_NO_FLUSH, out);
}

void DeflateTransform::Finish(Bytes& out) {
    if (finished_) {
        return;
    }
    Run(nullptr, 0, Z_FINISH, out);
    finished_ = true;
}

struct InflateTransform::State {
    z_stream zs{};
    std::array<std::uint8_t, kOutBufferSize> buffer{};
};

InflateTransform::InflateTransform() : state_(std::make_unique<State>()) {
    if (inflateInit(&state_->zs) != Z_OK) {
        throw std::runtime_error("Failed to initialize inflate stream");
    }
}

InflateTransform::~InflateTransform() {
    inflateEnd(&state_->zs);
}

void InflateTransform::Feed(const std::uint8_t* data, std::size_t len, Bytes& out) {
    if (finished_) {
        throw std::logic_error("InflateTransform::Feed after Finish");
    }
    if (len == 0) {
        return;
    }
    if (stream_end_) {
        throw CorruptSection("trailing bytes after end of compressed stream");
    }
    z_stream& zs = state_->zs;
    std::size_t offset = 0;
    while (offset < len) {
        std::size_t slice = std::min(len - offset, kMaxZlibSlice);
        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data + offset));
        zs.avail_in = static_cast<uInt>(slice);
        int rc = Z_OK;
        do {
            zs.next_out = state_->buffer.data();
            zs.avail_out = static_cast<uInt>(state_->buffer.size());
            rc = inflate(&zs, Z_NO_FLUSH);
            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                throw CorruptSection(ZlibMessage(zs, rc));
            }
            std::size_t produced = state_->buffer.size() - zs.avail_out;
            out.insert(out.end(), state_->buffer.begin(),
                       state_->buffer.begin() + static_cast<std::ptrdiff_t>(produced));
            if (rc == Z_STREAM_END) {
                stream_end_ = true;
                if (zs.avail_in > 0 || offset + slice < len) {
                    throw CorruptSection("trailing bytes after end of compressed stream");
                }
                return;
            }
        } while (rc != Z_BUF_ERROR && (zs.avail_in > 0 || zs.avail_out == 0));
        offset += slice;
    }
}

void InflateTransform::Finish(Bytes&) {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (!stream_end_) {
        throw CorruptSection("compressed stream ended before its final block");
    }
}

std::unique_ptr<StreamTransform> MakeEncoder(bool compressed) {
    if (compressed) {
        return std::make_unique<DeflateTransform>();
    }
    return std::make_unique<IdentityTransform>();
}

std::unique_ptr<StreamTransform> MakeDecoder(bool compressed) {
    if (compressed) {
        return std::make_unique<InflateTransform>();
    }
    return std::make_unique<IdentityTransform>();
}

}  // namespace brstitch::transform
