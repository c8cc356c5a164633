#pragma once

#include "hybridrag/types.hpp"

#include <vector>

namespace hybridrag {

/**
 * Reciprocal Rank Fusion over any number of ranked lists.
 *
 * fused_score(d) = sum over lists containing d of 1 / (k + rank).
 * Output is ordered by descending fused_score; ties break on (a) number of
 * contributing lists, descending, (b) dense rank ascending when present,
 * (c) document_id lexicographically. The result is identical for identical
 * inputs regardless of list order.
 *
 * Pure and synchronous. Truncation to top_k is the caller's job and must
 * happen after fusion.
 */
class RankFuser {
public:
    static constexpr double kDefaultK = 60.0;

    explicit RankFuser(double k = kDefaultK);

    std::vector<FusedResult> fuse(const std::vector<RankedList>& lists) const;

    double k() const { return k_; }

private:
    double k_;
};

// Ordering predicate used by fuse(); exposed for tests and callers that
// merge already-fused results.
bool fused_before(const FusedResult& lhs, const FusedResult& rhs);

} // namespace hybridrag
