#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace brstitch {

// Header bytes that are not a section header: wrong length, magic, flags or name encoding.
class MalformedHeader : public std::runtime_error {
public:
    explicit MalformedHeader(const std::string& what) : std::runtime_error("Malformed section header: " + what) {}
};

// A section that passed validation could not be opened when its payload was needed.
class SectionUnavailable : public std::runtime_error {
public:
    explicit SectionUnavailable(const std::string& path)
        : std::runtime_error("Section file unavailable: " + path), path_(path) {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

// Payload bytes the inverse transform rejects, or a stream that ends early.
class CorruptSection : public std::runtime_error {
public:
    explicit CorruptSection(const std::string& what) : std::runtime_error("Corrupt section data: " + what) {}
};

class OperationInterrupted : public std::runtime_error {
public:
    OperationInterrupted() : std::runtime_error("Operation interrupted") {}
};

enum class GroupCondition {
    Incomplete,
    Inconsistent,
    Duplicate,
    Excess
};

const char* ConditionName(GroupCondition condition);

// A group whose conditions the caller declined to ignore.
class GroupRejected : public std::runtime_error {
public:
    GroupRejected(const std::string& name, std::vector<GroupCondition> conditions, const std::string& detail);

    const std::string& name() const noexcept { return name_; }
    const std::vector<GroupCondition>& conditions() const noexcept { return conditions_; }

private:
    std::string name_;
    std::vector<GroupCondition> conditions_;
};

}  // namespace brstitch
