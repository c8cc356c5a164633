#pragma once

#include "hybridrag/cancellation.hpp"
#include "hybridrag/circuit_breaker.hpp"
#include "hybridrag/collaborators.hpp"
#include "hybridrag/config.hpp"
#include "hybridrag/deadline_guard.hpp"
#include "hybridrag/rank_fuser.hpp"
#include "hybridrag/task_pool.hpp"
#include "hybridrag/types.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace hybridrag {

struct OrchestratorOptions {
    std::chrono::milliseconds budget{800};
    std::optional<std::chrono::milliseconds> dense_budget;
    std::optional<std::chrono::milliseconds> sparse_budget;
    double rrf_k = RankFuser::kDefaultK;
    std::size_t max_top_k = 100;
    std::size_t candidate_multiplier = 2;

    static OrchestratorOptions from_config(const RetrievalConfig& config);
};

/**
 * Hybrid search over one tenant: dense and sparse retrieval run concurrently
 * under a shared DeadlineGuard budget, each admitted by the vector-store
 * circuit breaker. A failed, timed-out or rejected branch contributes an
 * empty list; only when no branch produced a result does search() throw
 * RetrievalFailure. Surviving lists are fused with RRF, truncated to top_k
 * and decorated with the stored content.
 */
class SearchOrchestrator {
public:
    SearchOrchestrator(std::shared_ptr<DenseRetriever> dense,
                       std::shared_ptr<SparseRetriever> sparse,
                       std::shared_ptr<CircuitBreaker> vector_store_breaker,
                       TaskPool& pool,
                       OrchestratorOptions options = {});

    // Throws InvalidArgumentError, RetrievalFailure, or CancelledError when
    // the caller cancelled before any branch finished.
    SearchResponse search(const SearchRequest& request, const CancellationToken& token = {}) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    void validate(const SearchRequest& request) const;

    std::shared_ptr<DenseRetriever> dense_;
    std::shared_ptr<SparseRetriever> sparse_;
    std::shared_ptr<CircuitBreaker> breaker_;
    DeadlineGuard guard_;
    RankFuser fuser_;
    OrchestratorOptions options_;
};

} // namespace hybridrag
