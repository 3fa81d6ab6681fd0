#include "brstitch/registry.hpp"

#include "brstitch/constants.hpp"
#include "brstitch/file_stream.hpp"
#include "brstitch/fileio.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace brstitch::registry {

namespace {

constexpr std::size_t kMissingListLimit = 64;

void AddCondition(GroupReport& report, GroupCondition condition) {
    if (!report.Has(condition)) {
        report.conditions.push_back(condition);
    }
}

}  // namespace

bool GroupReport::Has(GroupCondition condition) const {
    return std::find(conditions.begin(), conditions.end(), condition) != conditions.end();
}

bool GroupReport::Stitchable() const {
    return !Has(GroupCondition::Incomplete) && !Has(GroupCondition::Inconsistent)
           && !Has(GroupCondition::Duplicate);
}

bool SectionRegistry::Scan(const std::filesystem::path& path) {
    try {
        std::optional<std::ifstream> input = fileio::OpenForRead(path);
        if (!input) {
            invalid_.push_back({path, "file does not exist"});
            return false;
        }
        filestream::FileReader reader(std::move(*input), path.string(), constants::kHeaderSize);
        header::HeaderBytes bytes{};
        std::size_t got = reader.ReadExact(bytes.data(), bytes.size());
        Add(path, header::Decode(bytes.data(), got));
        return true;
    } catch (const std::runtime_error& exc) {
        invalid_.push_back({path, exc.what()});
        return false;
    }
}

void SectionRegistry::ScanAll(const std::vector<std::filesystem::path>& paths) {
    for (const auto& path : paths) {
        Scan(path);
    }
}

void SectionRegistry::Add(const std::filesystem::path& path, const header::Header& header) {
    Group& group = groups_[header.name];
    group.claims[header.index].push_back({path, header.compressed});
    if (header.last) {
        std::uint64_t claimed = static_cast<std::uint64_t>(header.index) + 1;
        if (!group.count || claimed < *group.count) {
            group.count = claimed;
        }
    }
}

std::vector<GroupReport> SectionRegistry::Resolve() const {
    std::vector<GroupReport> reports;
    reports.reserve(groups_.size());
    for (const auto& [name, group] : groups_) {
        reports.push_back(ResolveGroup(name, group));
    }
    return reports;
}

GroupReport SectionRegistry::ResolveGroup(const std::string& name, const Group& group) {
    GroupReport report;
    report.name = name;
    report.count = group.count;
    report.plan.name = name;

    for (const auto& [index, claims] : group.claims) {
        std::vector<std::filesystem::path> paths;
        for (const auto& claim : claims) {
            paths.push_back(claim.path);
            (claim.compressed ? report.compressed_paths : report.plain_paths).push_back(claim.path);
        }
        std::sort(paths.begin(), paths.end());

        if (group.count && index >= *group.count) {
            report.excess.insert(report.excess.end(), paths.begin(), paths.end());
            continue;
        }
        if (paths.size() > 1) {
            report.duplicates[index] = paths;
            continue;
        }
        report.plan.sections[index] = paths.front();
    }
    std::sort(report.compressed_paths.begin(), report.compressed_paths.end());
    std::sort(report.plain_paths.begin(), report.plain_paths.end());

    // Indices expected but unclaimed. Without a LAST section the span ends at the highest claim.
    std::uint64_t span = 0;
    if (group.count) {
        span = *group.count;
    } else if (!group.claims.empty()) {
        span = static_cast<std::uint64_t>(group.claims.rbegin()->first) + 1;
    }
    std::uint64_t next = 0;
    auto note_gap = [&report](std::uint64_t from, std::uint64_t to) {
        if (to <= from) {
            return;
        }
        report.missing_total += to - from;
        for (std::uint64_t i = from; i < to && report.missing.size() < kMissingListLimit; ++i) {
            report.missing.push_back(static_cast<std::uint32_t>(i));
        }
    };
    for (const auto& entry : group.claims) {
        std::uint64_t index = entry.first;
        if (index >= span) {
            break;
        }
        note_gap(next, index);
        next = index + 1;
    }
    note_gap(next, span);

    if (!group.count || report.missing_total > 0) {
        AddCondition(report, GroupCondition::Incomplete);
    }
    if (!report.duplicates.empty()) {
        AddCondition(report, GroupCondition::Duplicate);
    }
    if (!report.compressed_paths.empty() && !report.plain_paths.empty()) {
        AddCondition(report, GroupCondition::Inconsistent);
    }
    if (!report.excess.empty()) {
        AddCondition(report, GroupCondition::Excess);
    }

    report.plan.compressed = !report.compressed_paths.empty() && report.plain_paths.empty();
    report.plan.count = report.Stitchable() ? *group.count : 0;
    return report;
}

}  // namespace brstitch::registry
