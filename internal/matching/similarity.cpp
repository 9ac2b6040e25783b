#include "similarity.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace cashgraph::matching {

namespace {

std::string Squash(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c)) out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

std::unordered_map<std::string, int> Bigrams(const std::string& s) {
  std::unordered_map<std::string, int> grams;
  for (std::size_t i = 0; i + 1 < s.size(); ++i) ++grams[s.substr(i, 2)];
  return grams;
}

} // namespace

double BigramDice(std::string_view a, std::string_view b) {
  const auto left  = Squash(a);
  const auto right = Squash(b);
  if (left.empty() || right.empty()) return 0.0;
  if (left == right) return 1.0;
  if (left.size() < 2 || right.size() < 2) return 0.0;

  auto lg = Bigrams(left);
  auto rg = Bigrams(right);

  int overlap = 0;
  for (const auto& [gram, count] : lg) {
    auto it = rg.find(gram);
    if (it != rg.end()) overlap += std::min(count, it->second);
  }

  const auto total = static_cast<double>((left.size() - 1) + (right.size() - 1));
  return 2.0 * overlap / total;
}

} // namespace cashgraph::matching
