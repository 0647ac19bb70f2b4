#pragma once

#include <iosfwd>
#include <string>

namespace krecon {

// Prints `message`, asks the user to type `approval` and reads one line.
// Throws NotConfirmed unless the line matches exactly.
void confirm(const std::string &message, const std::string &approval,
             std::istream &in, std::ostream &out);

} // namespace krecon
