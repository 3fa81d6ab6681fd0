#include "brstitch/splitter.hpp"

#include "brstitch/interrupt.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace brstitch::split {

Splitter::Splitter(std::size_t payload_size, bool compressed, EmitFn emit)
    : payload_size_(payload_size),
      encoder_(transform::MakeEncoder(compressed)),
      emit_(std::move(emit)) {
    if (payload_size_ == 0) {
        throw std::invalid_argument("Section payload size must be at least one byte");
    }
    if (!emit_) {
        throw std::invalid_argument("Splitter requires an emit callback");
    }
}

void Splitter::Feed(const std::uint8_t* data, std::size_t len) {
    if (finished_) {
        throw std::logic_error("Splitter::Feed after Finish");
    }
    bytes_in_ += len;
    encoder_->Feed(data, len, pending_);
    EmitFullBlocks();
}

void Splitter::Finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    encoder_->Finish(pending_);
    EmitFullBlocks();
    Emit(pending_.data() + pending_start_, pending_.size() - pending_start_, true);
    pending_.clear();
    pending_start_ = 0;
}

// Strictly more than one block must be pending so the final Emit is never empty
// unless the whole encoded stream is.
void Splitter::EmitFullBlocks() {
    while (pending_.size() - pending_start_ > payload_size_) {
        Emit(pending_.data() + pending_start_, payload_size_, false);
        pending_start_ += payload_size_;
    }
    if (pending_start_ > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(pending_start_));
        pending_start_ = 0;
    }
}

void Splitter::Emit(const std::uint8_t* data, std::size_t len, bool last) {
    emit_(data, len, last);
    ++blocks_;
    bytes_out_ += len;
}

SplitCounts SplitStream(std::istream& input,
                          std::size_t payload_size,
                          bool compressed,
                          std::size_t read_chunk,
                          const EmitFn& emit) {
    if (read_chunk == 0) {
        throw std::invalid_argument("Read chunk size must be positive");
    }
    Splitter splitter(payload_size, compressed, emit);
    std::vector<std::uint8_t> buffer(read_chunk);
    while (input) {
        interrupt::ThrowIfPending();
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = input.gcount();
        if (input.bad()) {
            throw std::runtime_error("Failed to read input stream");
        }
        if (got > 0) {
            splitter.Feed(buffer.data(), static_cast<std::size_t>(got));
        }
    }
    interrupt::ThrowIfPending();
    splitter.Finish();
    return {splitter.BlocksEmitted(), splitter.BytesIn(), splitter.BytesOut()};
}

}  // namespace brstitch::split
