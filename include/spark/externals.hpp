#pragma once

#include <map>
#include <string>

#include "resolvable.hpp"

namespace spark {

using ExternalMap = std::map <std::string, Value>;

// Merges bindings; empty resolvable references never replace existing links
void apply_externals(ExternalMap &, const ExternalMap &);

// Substitutes every standalone occurrence of an external name with
// its resolved form; names after a dot are never externals, and an
// access on an external is spelled by the member names of the context
std::string replace_externals(ResolutionContext &, const ExternalMap &, const std::string &);

} // namespace spark
