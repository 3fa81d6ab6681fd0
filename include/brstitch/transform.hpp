#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace brstitch::transform {

using Bytes = std::vector<std::uint8_t>;

// Stateful byte transform. Output for a given input may be delayed until later
// Feed calls or Finish; concatenated output depends only on the concatenated input.
class StreamTransform {
public:
    virtual ~StreamTransform() = default;

    // Appends whatever output is available to out.
    virtual void Feed(const std::uint8_t* data, std::size_t len, Bytes& out) = 0;
    // Flushes remaining state into out. No Feed may follow.
    virtual void Finish(Bytes& out) = 0;
};

class IdentityTransform final : public StreamTransform {
public:
    void Feed(const std::uint8_t* data, std::size_t len, Bytes& out) override;
    void Finish(Bytes& out) override;
};

// zlib-format DEFLATE encoder covering the whole stream.
class DeflateTransform final : public StreamTransform {
public:
    explicit DeflateTransform(int level = -1);
    ~DeflateTransform() override;

    DeflateTransform(const DeflateTransform&) = delete;
    DeflateTransform& operator=(const DeflateTransform&) = delete;

    void Feed(const std::uint8_t* data, std::size_t len, Bytes& out) override;
    void Finish(Bytes& out) override;

private:
    struct State;
    void Run(const std::uint8_t* data, std::size_t len, int flush, Bytes& out);

    std::unique_ptr<State> state_;
    bool finished_ = false;
};

// Inverse of DeflateTransform. Throws CorruptSection on bad data, data past the
// end of the stream, or a stream that has not ended when Finish is called.
class InflateTransform final : public StreamTransform {
public:
    InflateTransform();
    ~InflateTransform() override;

    InflateTransform(const InflateTransform&) = delete;
    InflateTransform& operator=(const InflateTransform&) = delete;

    void Feed(const std::uint8_t* data, std::size_t len, Bytes& out) override;
    void Finish(Bytes& out) override;

private:
    struct State;

    std::unique_ptr<State> state_;
    bool stream_end_ = false;
    bool finished_ = false;
};

std::unique_ptr<StreamTransform> MakeEncoder(bool compressed);
std::unique_ptr<StreamTransform> MakeDecoder(bool compressed);

}  // namespace brstitch::transform
