#include "brstitch/fileio.hpp"

#include "brstitch/constants.hpp"
#include "brstitch/log.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <system_error>

namespace brstitch::fileio {

namespace fs = std::filesystem;

std::optional<std::ifstream> OpenForRead(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw std::runtime_error("Failed to stat " + log::Quote(path.string()) + ": " + ec.message());
        }
        return std::nullopt;
    }
    if (fs::is_directory(path, ec)) {
        throw std::runtime_error("Expected a file but found a directory: " + log::Quote(path.string()));
    }
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + log::Quote(path.string()));
    }
    return input;
}

std::ofstream OpenForWrite(const fs::path& path, confirm::Confirmer& confirmer) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!confirmer.Confirm("file " + log::Quote(path.string()) + " already exists, overwrite?")) {
            throw std::runtime_error("file already exists at: " + log::Quote(path.string()));
        }
    }
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + log::Quote(path.string()));
    }
    return output;
}

void CreateDirectory(const fs::path& path, confirm::Confirmer& confirmer) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!confirmer.Confirm("directory " + log::Quote(path.string()) + " already exists, overwrite?")) {
            throw std::runtime_error("directory already exists at: " + log::Quote(path.string()));
        }
        fs::remove_all(path, ec);
        if (ec) {
            throw std::runtime_error("Failed to remove " + log::Quote(path.string()) + ": " + ec.message());
        }
    }
    fs::create_directories(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + log::Quote(path.string()) + ": " + ec.message());
    }
}

void DeletePaths(const std::vector<fs::path>& paths) {
    std::vector<std::string> failures;
    for (const auto& path : paths) {
        std::error_code ec;
        auto status = fs::symlink_status(path, ec);
        if (ec || !fs::exists(status)) {
            continue;
        }
        if (fs::is_directory(status)) {
            fs::remove_all(path, ec);
        } else {
            fs::remove(path, ec);
        }
        if (ec) {
            failures.push_back(log::Quote(path.string()) + " (" + ec.message() + ")");
        }
    }
    if (!failures.empty()) {
        std::string message = "Failed to delete paths:";
        for (const auto& failure : failures) {
            message += " " + failure;
        }
        throw std::runtime_error(message);
    }
}

bool HasSectionExtension(const fs::path& path) {
    return path.extension() == fs::path(std::string(constants::kSectionExt));
}

std::vector<fs::path> CollectCandidates(const std::vector<fs::path>& paths) {
    std::vector<fs::path> all;
    for (const auto& path : paths) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            std::vector<fs::path> listed;
            for (const auto& entry : fs::directory_iterator(path)) {
                if (entry.is_regular_file(ec)) {
                    listed.push_back(entry.path());
                }
            }
            std::sort(listed.begin(), listed.end());
            all.insert(all.end(), listed.begin(), listed.end());
        } else {
            all.push_back(path);
        }
    }
    std::set<fs::path> seen;
    std::vector<fs::path> unique;
    for (const auto& path : all) {
        if (!HasSectionExtension(path)) {
            continue;
        }
        std::error_code ec;
        fs::path key = fs::weakly_canonical(path, ec);
        if (ec) {
            key = path.lexically_normal();
        }
        if (seen.insert(key).second) {
            unique.push_back(path);
        }
    }
    return unique;
}

std::string SanitizeStem(std::string stem) {
    std::replace(stem.begin(), stem.end(), ' ', '_');
    return stem;
}

SectionNamer::SectionNamer(const fs::path& input, bool nest, const fs::path& output_dir)
    : stem_(SanitizeStem(input.stem().string())), base_dir_(output_dir) {
    if (stem_.empty()) {
        throw std::invalid_argument("Cannot derive section names from " + log::Quote(input.string()));
    }
    if (nest) {
        nest_dir_ = base_dir_ / (stem_ + std::string(constants::kNestSuffix));
    }
}

fs::path SectionNamer::PathFor(std::uint32_t index) const {
    std::string filename = stem_ + "_" + std::to_string(index) + std::string(constants::kSectionExt);
    if (nest_dir_) {
        return *nest_dir_ / filename;
    }
    return base_dir_ / filename;
}

}  // namespace brstitch::fileio
