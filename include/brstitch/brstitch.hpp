#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "brstitch/confirm.hpp"
#include "brstitch/constants.hpp"
#include "brstitch/stitcher.hpp"

namespace brstitch {

struct SplitOptions {
    // Whole section file size, header included. Must exceed the header size.
    std::size_t section_size = constants::DefaultSectionSize();
    bool compress = true;
    bool nest = false;
    bool delete_original = false;
    std::size_t chunk_size = constants::DefaultChunkSize();
    std::filesystem::path output_dir;
    // Called after each section file is complete on disk.
    std::function<void(const std::filesystem::path&)> on_section;
};

struct SplitResult {
    std::filesystem::path input;
    std::vector<std::filesystem::path> sections;
    std::optional<std::filesystem::path> directory;
    std::uint64_t input_bytes = 0;
    bool skipped = false;
};

// Splits path into section files. Either every section is written or none is
// left on disk: on any failure, including interruption, the sections written so
// far (or the nest directory) are deleted before the error propagates.
SplitResult SplitFile(const std::filesystem::path& path, const SplitOptions& options, confirm::Confirmer& confirmer);

struct StitchOptions {
    bool keep_sections = false;
    std::filesystem::path output_dir;
    std::size_t chunk_size = constants::DefaultChunkSize();
};

struct StitchSummary {
    std::vector<std::filesystem::path> outputs;
    std::vector<std::string> skipped;
    std::vector<std::pair<std::string, std::string>> failed;
};

// Reassembles one validated group into output. A partially written output is
// removed if stitching fails. Returns the number of bytes written.
std::uint64_t StitchToFile(const stitch::StitchPlan& plan,
                           const std::filesystem::path& output,
                           std::size_t chunk_size,
                           confirm::Confirmer& confirmer);

// Stitches every complete group found among paths (directories are expanded).
// Problems are put to the confirmer; a group that loses a section mid-stitch
// fails alone and the remaining groups continue.
StitchSummary StitchFiles(const std::vector<std::filesystem::path>& paths,
                          const StitchOptions& options,
                          confirm::Confirmer& confirmer);

// Parses sizes like "512", "64kb", "1.5mb", "2GB".
std::size_t ParseSize(const std::string& text);

}  // namespace brstitch
