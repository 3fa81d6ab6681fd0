#pragma once

#include <iostream>
#include <istream>
#include <ostream>
#include <string>

namespace brstitch::confirm {

enum class ConfirmPolicy {
    Ask,
    AssumeYes,
    AssumeNo
};

// Answers yes/no questions according to a policy. In Ask mode the user may
// answer 'a', which switches this confirmer to AssumeYes for the rest of the run.
class Confirmer {
public:
    explicit Confirmer(ConfirmPolicy policy = ConfirmPolicy::Ask,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    bool Confirm(const std::string& question);

    ConfirmPolicy Policy() const noexcept { return policy_; }
    void SetPolicy(ConfirmPolicy policy) noexcept { policy_ = policy; }

private:
    ConfirmPolicy policy_;
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace brstitch::confirm
