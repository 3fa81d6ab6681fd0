#include "brstitch/validator.hpp"

#include "brstitch/log.hpp"

#include <stdexcept>
#include <vector>

namespace brstitch::validate {

namespace {

std::string JoinPaths(const std::vector<std::filesystem::path>& paths) {
    std::string out = "[";
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += log::Quote(paths[i].string());
    }
    out += "]";
    return out;
}

std::string DescribeMissing(const registry::GroupReport& report) {
    std::string out;
    if (!report.count) {
        out = "no section is marked last";
    }
    if (report.missing_total > 0) {
        if (!out.empty()) {
            out += "; ";
        }
        out += "missing indices";
        for (std::uint32_t index : report.missing) {
            out += " " + std::to_string(index);
        }
        if (report.missing_total > report.missing.size()) {
            out += " and " + std::to_string(report.missing_total - report.missing.size()) + " more";
        }
    }
    std::vector<std::filesystem::path> have;
    for (const auto& [index, path] : report.plan.sections) {
        have.push_back(path);
    }
    out += "; have sections: " + JoinPaths(have);
    return out;
}

std::vector<GroupCondition> BlockingConditions(const registry::GroupReport& report) {
    std::vector<GroupCondition> out;
    for (GroupCondition condition : report.conditions) {
        if (condition != GroupCondition::Excess) {
            out.push_back(condition);
        }
    }
    return out;
}

}  // namespace

std::string Describe(const registry::GroupReport& report) {
    std::vector<std::string> parts;
    if (report.Has(GroupCondition::Incomplete)) {
        parts.push_back(DescribeMissing(report));
    }
    if (report.Has(GroupCondition::Duplicate)) {
        std::string part;
        for (const auto& [index, paths] : report.duplicates) {
            if (!part.empty()) {
                part += "; ";
            }
            part += "index " + std::to_string(index) + " claimed by " + JoinPaths(paths);
        }
        parts.push_back(part);
    }
    if (report.Has(GroupCondition::Inconsistent)) {
        parts.push_back("compressed " + JoinPaths(report.compressed_paths) + " vs uncompressed "
                        + JoinPaths(report.plain_paths));
    }
    if (report.Has(GroupCondition::Excess)) {
        parts.push_back("beyond the last section: " + JoinPaths(report.excess));
    }
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) {
            out += " | ";
        }
        out += part;
    }
    return out;
}

std::optional<stitch::StitchPlan> Review(const registry::GroupReport& report, confirm::Confirmer& confirmer) {
    std::vector<GroupCondition> blocking = BlockingConditions(report);
    if (!blocking.empty()) {
        std::string problems;
        for (GroupCondition condition : blocking) {
            if (!problems.empty()) {
                problems += ", ";
            }
            problems += ConditionName(condition);
        }
        std::string detail = Describe(report);
        log::Warn(log::Quote(report.name) + ": " + detail);
        if (!confirmer.Confirm(problems + " for " + log::Quote(report.name) + ", ignore?")) {
            throw GroupRejected(report.name, blocking, detail);
        }
        return std::nullopt;
    }
    if (report.Has(GroupCondition::Excess)) {
        if (!confirmer.Confirm("unneeded section files " + JoinPaths(report.excess) + " for "
                               + log::Quote(report.name) + ", ignore?")) {
            throw GroupRejected(report.name, {GroupCondition::Excess}, Describe(report));
        }
    }
    if (!report.count || report.plan.count != *report.count) {
        throw std::logic_error("Stitchable group " + report.name + " has no resolved plan");
    }
    return report.plan;
}

void ReviewInvalid(const registry::InvalidCandidate& candidate, confirm::Confirmer& confirmer) {
    if (!confirmer.Confirm("invalid section file " + log::Quote(candidate.path.string()) + " ("
                           + candidate.reason + "), ignore?")) {
        throw std::runtime_error("invalid section file " + log::Quote(candidate.path.string()) + ": "
                                 + candidate.reason);
    }
}

}  // namespace brstitch::validate
