#pragma once

#include "brstitch/confirm.hpp"
#include "brstitch/registry.hpp"
#include "brstitch/stitcher.hpp"

#include <optional>
#include <string>

namespace brstitch::validate {

// Human readable description of every condition found in report.
std::string Describe(const registry::GroupReport& report);

// Decides what happens to a group. Returns the plan when the group may be
// stitched (excess sections dropped), std::nullopt when the confirmer agreed to
// skip it, and throws GroupRejected when the confirmer declined to ignore a problem.
std::optional<stitch::StitchPlan> Review(const registry::GroupReport& report, confirm::Confirmer& confirmer);

// Asks whether an unreadable candidate may be skipped; throws when declined.
void ReviewInvalid(const registry::InvalidCandidate& candidate, confirm::Confirmer& confirmer);

}  // namespace brstitch::validate
