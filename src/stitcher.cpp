#include "brstitch/stitcher.hpp"

#include "brstitch/constants.hpp"
#include "brstitch/errors.hpp"
#include "brstitch/file_stream.hpp"
#include "brstitch/fileio.hpp"
#include "brstitch/interrupt.hpp"
#include "brstitch/transform.hpp"

#include <array>
#include <optional>
#include <stdexcept>
#include <utility>

namespace brstitch::stitch {

namespace {

void WriteOut(std::ostream& sink, const transform::Bytes& data, std::uint64_t& written) {
    if (data.empty()) {
        return;
    }
    sink.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!sink) {
        throw std::runtime_error("Failed to write stitched output");
    }
    written += data.size();
}

filestream::FileReader OpenSection(const std::filesystem::path& path, std::size_t read_chunk) {
    std::optional<std::ifstream> input;
    try {
        input = fileio::OpenForRead(path);
    } catch (const std::runtime_error&) {
        throw SectionUnavailable(path.string());
    }
    if (!input) {
        throw SectionUnavailable(path.string());
    }
    return filestream::FileReader(std::move(*input), path.string(), read_chunk);
}

}  // namespace

std::uint64_t StitchSections(const StitchPlan& plan,
                             std::ostream& sink,
                             std::size_t read_chunk,
                             const SectionObserver& observer) {
    if (plan.count == 0) {
        throw std::invalid_argument("Stitch plan for " + plan.name + " has no sections");
    }
    auto decoder = transform::MakeDecoder(plan.compressed);
    transform::Bytes decoded;
    std::uint64_t written = 0;

    for (std::uint64_t i = 0; i < plan.count; ++i) {
        interrupt::ThrowIfPending();
        auto index = static_cast<std::uint32_t>(i);
        auto it = plan.sections.find(index);
        if (it == plan.sections.end()) {
            throw std::invalid_argument("Stitch plan for " + plan.name + " lacks section "
                                        + std::to_string(index));
        }
        if (observer) {
            observer(index, it->second);
        }

        filestream::FileReader reader = OpenSection(it->second, read_chunk);
        std::array<std::uint8_t, constants::kHeaderSize> skipped{};
        if (reader.ReadExact(skipped.data(), skipped.size()) != skipped.size()) {
            throw SectionUnavailable(it->second.string());
        }
        while (true) {
            auto [chunk, size] = reader.ReadChunk();
            if (size == 0) {
                break;
            }
            decoded.clear();
            decoder->Feed(chunk, size, decoded);
            WriteOut(sink, decoded, written);
        }
    }

    decoded.clear();
    decoder->Finish(decoded);
    WriteOut(sink, decoded, written);
    sink.flush();
    if (!sink) {
        throw std::runtime_error("Failed to flush stitched output");
    }
    return written;
}

}  // namespace brstitch::stitch
