#include "brstitch/errors.hpp"

#include "brstitch/log.hpp"

#include <utility>

namespace brstitch {

namespace {

std::string DescribeRejection(const std::string& name,
                              const std::vector<GroupCondition>& conditions,
                              const std::string& detail) {
    std::string message = "cannot stitch " + log::Quote(name) + " (";
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) {
            message += ", ";
        }
        message += ConditionName(conditions[i]);
    }
    message += ")";
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return message;
}

}  // namespace

const char* ConditionName(GroupCondition condition) {
    switch (condition) {
        case GroupCondition::Incomplete:
            return "missing sections";
        case GroupCondition::Inconsistent:
            return "inconsistent compression";
        case GroupCondition::Duplicate:
            return "duplicate sections";
        case GroupCondition::Excess:
            return "unneeded sections";
    }
    return "unknown condition";
}

GroupRejected::GroupRejected(const std::string& name,
                             std::vector<GroupCondition> conditions,
                             const std::string& detail)
    : std::runtime_error(DescribeRejection(name, conditions, detail)),
      name_(name),
      conditions_(std::move(conditions)) {}

}  // namespace brstitch
