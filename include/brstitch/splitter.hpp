#pragma once

#include "brstitch/transform.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>

namespace brstitch::split {

// Receives one output block. last is true exactly once, on the final call.
using EmitFn = std::function<void(const std::uint8_t* data, std::size_t len, bool last)>;

// Runs input through the encoder and re-chunks the encoded stream into blocks
// of exactly payload_size bytes; only the final block may be shorter. Block
// boundaries depend on the encoded stream alone, never on how input is fed.
class Splitter {
public:
    Splitter(std::size_t payload_size, bool compressed, EmitFn emit);

    Splitter(const Splitter&) = delete;
    Splitter& operator=(const Splitter&) = delete;

    void Feed(const std::uint8_t* data, std::size_t len);
    void Finish();

    std::uint64_t BlocksEmitted() const noexcept { return blocks_; }
    std::uint64_t BytesIn() const noexcept { return bytes_in_; }
    std::uint64_t BytesOut() const noexcept { return bytes_out_; }

private:
    void EmitFullBlocks();
    void Emit(const std::uint8_t* data, std::size_t len, bool last);

    std::size_t payload_size_;
    std::unique_ptr<transform::StreamTransform> encoder_;
    EmitFn emit_;
    transform::Bytes pending_;
    std::size_t pending_start_ = 0;
    std::uint64_t blocks_ = 0;
    std::uint64_t bytes_in_ = 0;
    std::uint64_t bytes_out_ = 0;
    bool finished_ = false;
};

struct SplitCounts {
    std::uint64_t blocks = 0;
    std::uint64_t bytes_in = 0;
    std::uint64_t bytes_out = 0;
};

// Reads input in chunks of read_chunk bytes and splits it. Polls for a pending
// interrupt between chunks.
SplitCounts SplitStream(std::istream& input,
                          std::size_t payload_size,
                          bool compressed,
                          std::size_t read_chunk,
                          const EmitFn& emit);

}  // namespace brstitch::split
