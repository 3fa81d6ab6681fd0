#include "brstitch/brstitch.hpp"

#include "brstitch/errors.hpp"
#include "brstitch/file_stream.hpp"
#include "brstitch/fileio.hpp"
#include "brstitch/header.hpp"
#include "brstitch/log.hpp"
#include "brstitch/registry.hpp"
#include "brstitch/splitter.hpp"
#include "brstitch/validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <system_error>

namespace brstitch {

namespace {

namespace fs = std::filesystem;

using SectionWriter = filestream::BufferedFileWriter<>;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// Output file for a group: only the final component of the stored name is
// used so a header cannot direct output outside output_dir.
fs::path OutputPathFor(const std::string& name, const fs::path& output_dir) {
    fs::path leaf = fs::u8path(name).filename();
    if (leaf.empty() || leaf == "." || leaf == "..") {
        throw std::runtime_error("Section name " + log::Quote(name) + " is not a usable file name");
    }
    return output_dir / leaf;
}

void EnsureDirectory(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + log::Quote(dir.string()) + ": " + ec.message());
    }
}

void CleanupSplit(const SplitResult& result) {
    std::vector<fs::path> targets;
    if (result.directory) {
        targets.push_back(*result.directory);
    } else {
        targets = result.sections;
    }
    try {
        fileio::DeletePaths(targets);
    } catch (const std::exception& exc) {
        log::Error(std::string("cleanup after failed split incomplete: ") + exc.what());
    }
}

}  // namespace

SplitResult SplitFile(const fs::path& path, const SplitOptions& options, confirm::Confirmer& confirmer) {
    if (options.section_size <= constants::kHeaderSize) {
        throw std::invalid_argument("cannot encode any data without at least "
                                    + std::to_string(constants::kHeaderSize + 1) + " byte sections");
    }
    SplitResult result;
    result.input = path;

    std::optional<std::ifstream> input = fileio::OpenForRead(path);
    if (!input) {
        if (!confirmer.Confirm("file " + log::Quote(path.string()) + " doesn't exist, ignore?")) {
            throw std::runtime_error("file doesn't exist at: " + log::Quote(path.string()));
        }
        result.skipped = true;
        return result;
    }

    const std::string stored_name = path.filename().u8string();
    if (!header::IsValidUtf8(stored_name)) {
        throw std::runtime_error("file name of " + log::Quote(path.string())
                                 + " is not valid UTF-8 and cannot be stored in a section header");
    }
    const std::string original_name = header::TruncateName(stored_name);
    if (original_name.size() < stored_name.size()) {
        log::Warn("name " + log::Quote(stored_name) + " is stored truncated as "
                  + log::Quote(original_name));
    }
    EnsureDirectory(options.output_dir);
    fileio::SectionNamer namer(path, options.nest, options.output_dir);
    log::Info("Splitting " + log::Quote(path.string()) + " into:");

    try {
        if (namer.NestDirectory()) {
            fileio::CreateDirectory(*namer.NestDirectory(), confirmer);
            result.directory = namer.NestDirectory();
        }

        std::uint64_t next_index = 0;
        auto emit = [&](const std::uint8_t* data, std::size_t len, bool last) {
            if (next_index > std::numeric_limits<std::uint32_t>::max()) {
                throw std::runtime_error("too many sections for " + log::Quote(path.string()));
            }
            auto index = static_cast<std::uint32_t>(next_index);
            fs::path section_path = namer.PathFor(index);
            log::Info("  " + log::Quote(section_path.string()));

            SectionWriter writer(fileio::OpenForWrite(section_path, confirmer), section_path.string());
            result.sections.push_back(section_path);
            header::HeaderBytes head = header::Encode(original_name, index, options.compress, last);
            writer.Write(head.data(), head.size());
            writer.Write(data, len);
            writer.Close();
            ++next_index;
            if (options.on_section) {
                options.on_section(section_path);
            }
        };

        split::SplitCounts counts = split::SplitStream(*input, options.section_size - constants::kHeaderSize,
                                                       options.compress, options.chunk_size, emit);
        result.input_bytes = counts.bytes_in;
    } catch (...) {
        CleanupSplit(result);
        throw;
    }

    if (options.delete_original) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw std::runtime_error("Failed to delete original " + log::Quote(path.string()) + ": "
                                     + ec.message());
        }
    }
    return result;
}

std::uint64_t StitchToFile(const stitch::StitchPlan& plan,
                           const fs::path& output,
                           std::size_t chunk_size,
                           confirm::Confirmer& confirmer) {
    std::ofstream out = fileio::OpenForWrite(output, confirmer);
    try {
        auto observer = [](std::uint32_t, const fs::path& section) {
            log::Info("  " + log::Quote(section.string()));
        };
        std::uint64_t written = stitch::StitchSections(plan, out, chunk_size, observer);
        out.close();
        if (!out) {
            throw std::runtime_error("Failed to close " + log::Quote(output.string()));
        }
        return written;
    } catch (...) {
        out.close();
        std::error_code ec;
        fs::remove(output, ec);
        if (ec) {
            log::Error("could not remove partial output " + log::Quote(output.string()) + ": " + ec.message());
        }
        throw;
    }
}

StitchSummary StitchFiles(const std::vector<fs::path>& paths,
                          const StitchOptions& options,
                          confirm::Confirmer& confirmer) {
    StitchSummary summary;
    registry::SectionRegistry sections;
    sections.ScanAll(fileio::CollectCandidates(paths));

    for (const auto& candidate : sections.Invalid()) {
        validate::ReviewInvalid(candidate, confirmer);
    }

    // Every group is reviewed before anything is written.
    std::vector<stitch::StitchPlan> plans;
    for (const auto& report : sections.Resolve()) {
        std::optional<stitch::StitchPlan> plan = validate::Review(report, confirmer);
        if (plan) {
            plans.push_back(std::move(*plan));
        } else {
            summary.skipped.push_back(report.name);
        }
    }

    if (!plans.empty()) {
        EnsureDirectory(options.output_dir);
    }
    for (const auto& plan : plans) {
        fs::path output;
        try {
            output = OutputPathFor(plan.name, options.output_dir);
        } catch (const std::runtime_error& exc) {
            log::Error(exc.what());
            summary.failed.emplace_back(plan.name, exc.what());
            continue;
        }
        log::Info("Stitching " + log::Quote(plan.name) + " from:");
        try {
            StitchToFile(plan, output, options.chunk_size, confirmer);
        } catch (const SectionUnavailable& exc) {
            log::Error(exc.what());
            summary.failed.emplace_back(plan.name, exc.what());
            continue;
        } catch (const CorruptSection& exc) {
            log::Error(exc.what());
            summary.failed.emplace_back(plan.name, exc.what());
            continue;
        }
        summary.outputs.push_back(output);

        if (!options.keep_sections) {
            std::vector<fs::path> consumed;
            for (const auto& [index, section] : plan.sections) {
                consumed.push_back(section);
            }
            fileio::DeletePaths(consumed);
        }
    }
    return summary;
}

std::size_t ParseSize(const std::string& text) {
    static const std::array<std::pair<const char*, std::uint64_t>, 4> kUnits = {{
        {"kb", 1ull << 10},
        {"mb", 1ull << 20},
        {"gb", 1ull << 30},
        {"b", 1ull},
    }};
    std::string value = ToLower(text);
    std::uint64_t multiplier = 1;
    for (const auto& [suffix, factor] : kUnits) {
        std::string unit(suffix);
        if (value.size() > unit.size() && value.compare(value.size() - unit.size(), unit.size(), unit) == 0) {
            value.resize(value.size() - unit.size());
            multiplier = factor;
            break;
        }
    }
    double number = 0.0;
    try {
        std::size_t consumed = 0;
        number = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid size format: " + text);
    }
    double bytes = std::floor(number * static_cast<double>(multiplier));
    if (!(bytes >= 0.0) || bytes >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        throw std::invalid_argument("Invalid size format: " + text);
    }
    return static_cast<std::size_t>(bytes);
}

}  // namespace brstitch
