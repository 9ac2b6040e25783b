#pragma once

#include <string>
#include <string_view>

namespace cashgraph::matching {

// Sorensen-Dice coefficient over character bigrams of the upper-cased,
// alphanumeric-only inputs. 1.0 for identical names, 0.0 when either side is empty.
double BigramDice(std::string_view a, std::string_view b);

} // namespace cashgraph::matching
