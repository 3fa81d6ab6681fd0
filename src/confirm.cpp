#include "brstitch/confirm.hpp"

#include "brstitch/cli_colors.hpp"
#include "brstitch/errors.hpp"
#include "brstitch/interrupt.hpp"
#include "brstitch/log.hpp"

#include <algorithm>
#include <cctype>

namespace brstitch::confirm {

namespace {

std::string Trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char ch) { return std::isspace(ch) != 0; });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char ch) { return std::isspace(ch) != 0; }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

}  // namespace

Confirmer::Confirmer(ConfirmPolicy policy, std::istream& in, std::ostream& out)
    : policy_(policy), in_(in), out_(out) {}

bool Confirmer::Confirm(const std::string& question) {
    if (policy_ == ConfirmPolicy::AssumeYes) {
        log::Warn(question + " yes");
        return true;
    }
    if (policy_ == ConfirmPolicy::AssumeNo) {
        log::Warn(question + " no");
        return false;
    }
    while (true) {
        out_ << cli::Colorize(question, cli::color::BOLD_YELLOW, out_) << " (y/n/a): " << std::flush;
        std::string line;
        if (!std::getline(in_, line)) {
            interrupt::ThrowIfPending();
            out_ << "\nCanceled.\n";
            return false;
        }
        std::string answer = Trim(line);
        if (answer.empty()) {
            continue;
        }
        char choice = static_cast<char>(std::tolower(static_cast<unsigned char>(answer[0])));
        if (answer.size() == 1 && choice == 'y') {
            return true;
        }
        if (answer.size() == 1 && choice == 'a') {
            policy_ = ConfirmPolicy::AssumeYes;
            return true;
        }
        out_ << "Canceled.\n";
        return false;
    }
}

}  // namespace brstitch::confirm
