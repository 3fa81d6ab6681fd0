#pragma once

#include "brstitch/confirm.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace brstitch::fileio {

// std::nullopt when nothing exists at path; throws when it exists but cannot be opened.
std::optional<std::ifstream> OpenForRead(const std::filesystem::path& path);

// Asks before replacing an existing file; throws if the answer is no.
std::ofstream OpenForWrite(const std::filesystem::path& path, confirm::Confirmer& confirmer);

// Asks before replacing an existing directory, which is removed first when confirmed.
void CreateDirectory(const std::filesystem::path& path, confirm::Confirmer& confirmer);

// Removes every path that exists, files and directories alike. Failures are
// collected and reported together after all paths were attempted.
void DeletePaths(const std::vector<std::filesystem::path>& paths);

// Expands directories one level to their regular files and keeps only section files.
// A file reached through more than one argument is listed once.
std::vector<std::filesystem::path> CollectCandidates(const std::vector<std::filesystem::path>& paths);

bool HasSectionExtension(const std::filesystem::path& path);

std::string SanitizeStem(std::string stem);

// Derives section paths "<stem>_<index>.brs" for one input, optionally inside
// a "<stem>_sections" directory.
class SectionNamer {
public:
    SectionNamer(const std::filesystem::path& input, bool nest, const std::filesystem::path& output_dir = {});

    std::filesystem::path PathFor(std::uint32_t index) const;
    const std::optional<std::filesystem::path>& NestDirectory() const noexcept { return nest_dir_; }

private:
    std::string stem_;
    std::filesystem::path base_dir_;
    std::optional<std::filesystem::path> nest_dir_;
};

}  // namespace brstitch::fileio
