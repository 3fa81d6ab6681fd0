#pragma once

#include "brstitch/errors.hpp"
#include "brstitch/header.hpp"
#include "brstitch/stitcher.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace brstitch::registry {

struct InvalidCandidate {
    std::filesystem::path path;
    std::string reason;
};

// Validation outcome for all sections that declare the same original name.
struct GroupReport {
    std::string name;
    // Earliest index carrying LAST, plus one. Unset when no section claims LAST.
    std::optional<std::uint64_t> count;
    std::vector<GroupCondition> conditions;

    // Indices with no section: [0, count) when count is known, otherwise up to the highest seen index.
    // Only the lowest few are listed; missing_total counts all of them.
    std::vector<std::uint32_t> missing;
    std::uint64_t missing_total = 0;
    // Indices below count claimed by more than one path.
    std::map<std::uint32_t, std::vector<std::filesystem::path>> duplicates;
    // Sections at or beyond count; never part of the plan.
    std::vector<std::filesystem::path> excess;
    std::vector<std::filesystem::path> compressed_paths;
    std::vector<std::filesystem::path> plain_paths;

    // Index -> path for every index below count that has a single claimant.
    stitch::StitchPlan plan;

    bool Has(GroupCondition condition) const;
    // True when nothing but excess sections was found.
    bool Stitchable() const;
};

// Groups candidate section files by the original name in their headers. The
// result of Resolve() does not depend on the order in which candidates were added.
class SectionRegistry {
public:
    // Reads and decodes the header of path. On failure records an invalid candidate and returns false.
    bool Scan(const std::filesystem::path& path);
    void ScanAll(const std::vector<std::filesystem::path>& paths);

    void Add(const std::filesystem::path& path, const header::Header& header);

    const std::vector<InvalidCandidate>& Invalid() const noexcept { return invalid_; }
    std::size_t GroupCount() const noexcept { return groups_.size(); }

    // One report per original name, ordered by name.
    std::vector<GroupReport> Resolve() const;

private:
    struct Claim {
        std::filesystem::path path;
        bool compressed = false;
    };

    struct Group {
        std::map<std::uint32_t, std::vector<Claim>> claims;
        std::optional<std::uint64_t> count;
    };

    static GroupReport ResolveGroup(const std::string& name, const Group& group);

    std::map<std::string, Group> groups_;
    std::vector<InvalidCandidate> invalid_;
};

}  // namespace brstitch::registry
