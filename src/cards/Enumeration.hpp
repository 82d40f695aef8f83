#pragma once

#include <cstddef>
#include <functional>
#include <vector>
#include "Canonical.hpp"

namespace isoholdem::cards {

using HandVisitor = std::function<void(const Hand&)>;

// Visits every canonical hand of the given length exactly once.
// Depth-first over the deck in index order, so the order is deterministic:
// street-agnostic hands ascend lexicographically by deck index; street-aware
// hands ascend by hole, then by board.
void for_each_canonical(int length, StreetMode mode, const HandVisitor& visit);

std::vector<Hand> deal_canonical(int length, StreetMode mode);

size_t count_canonical(int length, StreetMode mode);

// True if the partial hand can still be extended to a canonical hand of the
// given length. Exact for complete hands; for shorter ones it never rejects
// a prefix that has a canonical completion.
bool is_canonical_prefix(const Hand& partial, int length, StreetMode mode);

} // namespace isoholdem::cards
