#include "hybridrag/rank_fuser.hpp"
#include "hybridrag/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>

namespace hybridrag {
namespace {

struct Accumulator {
    std::map<RetrievalSource, std::uint32_t> source_ranks;
    std::vector<double> contributions;
};

} // namespace

RankFuser::RankFuser(double k) : k_(k) {
    HYBRIDRAG_CHECK_ARGUMENT(std::isfinite(k) && k > 0.0, "RRF k must be a positive constant");
}

std::vector<FusedResult> RankFuser::fuse(const std::vector<RankedList>& lists) const {
    std::unordered_map<std::string, Accumulator> accumulators;

    for (const auto& list : lists) {
        // A document listed twice in one list only counts at its best rank.
        std::unordered_map<std::string, std::uint32_t> best_rank;
        best_rank.reserve(list.size());
        for (const auto& hit : list) {
            HYBRIDRAG_CHECK_ARGUMENT(hit.rank >= 1, "ranks are 1-based, got 0 for " + hit.document_id);
            HYBRIDRAG_CHECK_ARGUMENT(!hit.document_id.empty(), "ranked hit without document_id");
            auto it = best_rank.find(hit.document_id);
            if (it == best_rank.end() || hit.rank < it->second) {
                best_rank[hit.document_id] = hit.rank;
            }
        }

        for (const auto& hit : list) {
            auto best = best_rank.find(hit.document_id);
            if (best == best_rank.end() || best->second != hit.rank) {
                continue;
            }
            best_rank.erase(best);

            auto& acc = accumulators[hit.document_id];
            acc.contributions.push_back(1.0 / (k_ + static_cast<double>(hit.rank)));
            auto existing = acc.source_ranks.find(hit.source);
            if (existing == acc.source_ranks.end() || hit.rank < existing->second) {
                acc.source_ranks[hit.source] = hit.rank;
            }
        }
    }

    std::vector<FusedResult> fused;
    fused.reserve(accumulators.size());
    for (auto& entry : accumulators) {
        auto& acc = entry.second;
        // Summing in a fixed order keeps the score bit-identical whatever
        // order the lists arrived in.
        std::sort(acc.contributions.begin(), acc.contributions.end());
        double score = 0.0;
        for (double c : acc.contributions) {
            score += c;
        }

        FusedResult result;
        result.document_id = entry.first;
        result.fused_score = score;
        result.source_ranks = std::move(acc.source_ranks);
        fused.push_back(std::move(result));
    }

    std::sort(fused.begin(), fused.end(), fused_before);
    return fused;
}

bool fused_before(const FusedResult& lhs, const FusedResult& rhs) {
    if (lhs.fused_score != rhs.fused_score) {
        return lhs.fused_score > rhs.fused_score;
    }
    if (lhs.source_ranks.size() != rhs.source_ranks.size()) {
        return lhs.source_ranks.size() > rhs.source_ranks.size();
    }

    auto lhs_dense = lhs.source_ranks.find(RetrievalSource::kDense);
    auto rhs_dense = rhs.source_ranks.find(RetrievalSource::kDense);
    const bool lhs_has = lhs_dense != lhs.source_ranks.end();
    const bool rhs_has = rhs_dense != rhs.source_ranks.end();
    if (lhs_has != rhs_has) {
        return lhs_has;
    }
    if (lhs_has && lhs_dense->second != rhs_dense->second) {
        return lhs_dense->second < rhs_dense->second;
    }
    return lhs.document_id < rhs.document_id;
}

} // namespace hybridrag
