#pragma once

#include <string>

namespace cashgraph::util {

// Row key for every stored record: a random RFC 4122 version 4 UUID in
// canonical lowercase text form.
std::string NewId();

} // namespace cashgraph::util
