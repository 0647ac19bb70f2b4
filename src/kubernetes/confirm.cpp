#include "kubernetes/confirm.hpp"

#include <istream>
#include <ostream>

#include "common/errors.hpp"

namespace krecon {

void confirm(const std::string &message, const std::string &approval,
             std::istream &in, std::ostream &out)
{
    out << message << "\n\n";
    out << "Please type '" << approval << "' to confirm: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        throw NotConfirmed("no confirmation received");
    }
    if (!answer.empty() && answer.back() == '\r') {
        answer.pop_back();
    }
    if (answer != approval) {
        throw NotConfirmed("aborted by user");
    }
}

} // namespace krecon
