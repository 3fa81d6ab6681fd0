#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <ostream>
#include <string>

namespace brstitch::stitch {

// A validated group ready for reassembly: sections[i] exists for every i in [0, count).
struct StitchPlan {
    std::string name;
    std::uint64_t count = 0;
    bool compressed = false;
    std::map<std::uint32_t, std::filesystem::path> sections;
};

using SectionObserver = std::function<void(std::uint32_t index, const std::filesystem::path& path)>;

// Streams the payload of every section, in index order, through one decoder
// instance into sink. Throws SectionUnavailable if a section cannot be opened or
// is shorter than its header, CorruptSection if the payload does not decode.
// Returns the number of bytes written to sink.
std::uint64_t StitchSections(const StitchPlan& plan,
                             std::ostream& sink,
                             std::size_t read_chunk,
                             const SectionObserver& observer = {});

}  // namespace brstitch::stitch
