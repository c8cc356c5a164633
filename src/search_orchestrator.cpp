#include "hybridrag/search_orchestrator.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"
#include "hybridrag/metrics.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <utility>

namespace hybridrag {
namespace {

using Documents = std::vector<RetrievedDocument>;

struct Branch {
    RetrievalSource source;
    std::optional<CircuitBreaker::Permit> permit;
    BranchReport report;
    std::optional<std::size_t> slot;  // index into the guard's outcomes
};

BranchStatus to_branch_status(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::kCompleted: return BranchStatus::kOk;
        case OutcomeStatus::kTimedOut: return BranchStatus::kTimedOut;
        case OutcomeStatus::kCancelled: return BranchStatus::kCancelled;
        case OutcomeStatus::kFailed: return BranchStatus::kFailed;
    }
    return BranchStatus::kFailed;
}

RankedList to_ranked_list(const Documents& documents, RetrievalSource source) {
    RankedList list;
    list.reserve(documents.size());
    for (std::size_t i = 0; i < documents.size(); ++i) {
        const auto& doc = documents[i];
        RankedHit hit;
        hit.document_id = doc.document_id;
        // Collaborators may leave rank unset; position is the rank then.
        hit.rank = doc.rank != 0 ? doc.rank : static_cast<std::uint32_t>(i + 1);
        hit.source = source;
        hit.raw_score = doc.raw_score;
        list.push_back(std::move(hit));
    }
    return list;
}

} // namespace

OrchestratorOptions OrchestratorOptions::from_config(const RetrievalConfig& config) {
    OrchestratorOptions options;
    options.budget = std::chrono::milliseconds(config.search_timeout_ms);
    if (config.dense_timeout_ms > 0) {
        options.dense_budget = std::chrono::milliseconds(config.dense_timeout_ms);
    }
    if (config.sparse_timeout_ms > 0) {
        options.sparse_budget = std::chrono::milliseconds(config.sparse_timeout_ms);
    }
    options.rrf_k = config.rrf_k;
    options.max_top_k = config.max_top_k;
    options.candidate_multiplier = config.candidate_multiplier;
    return options;
}

SearchOrchestrator::SearchOrchestrator(std::shared_ptr<DenseRetriever> dense,
                                       std::shared_ptr<SparseRetriever> sparse,
                                       std::shared_ptr<CircuitBreaker> vector_store_breaker,
                                       TaskPool& pool,
                                       OrchestratorOptions options)
    : dense_(std::move(dense))
    , sparse_(std::move(sparse))
    , breaker_(std::move(vector_store_breaker))
    , guard_(pool, options.budget)
    , fuser_(options.rrf_k)
    , options_(options) {
    HYBRIDRAG_CHECK_ARGUMENT(dense_ && sparse_, "both retrievers are required");
    HYBRIDRAG_CHECK_ARGUMENT(breaker_, "vector store breaker is required");
    HYBRIDRAG_CHECK_ARGUMENT(options_.budget.count() > 0, "search budget must be positive");
    HYBRIDRAG_CHECK_ARGUMENT(options_.max_top_k >= 1, "max_top_k must be at least 1");
    HYBRIDRAG_CHECK_ARGUMENT(options_.candidate_multiplier >= 1, "candidate_multiplier must be at least 1");
}

void SearchOrchestrator::validate(const SearchRequest& request) const {
    HYBRIDRAG_CHECK_ARGUMENT(!request.tenant_id.empty(), "tenant_id is required");
    HYBRIDRAG_CHECK_ARGUMENT(!request.query.empty(), "query must not be empty");
    HYBRIDRAG_CHECK_ARGUMENT(request.top_k >= 1 && request.top_k <= options_.max_top_k,
                             "top_k must be within [1, " + std::to_string(options_.max_top_k) + "]");
}

SearchResponse SearchOrchestrator::search(const SearchRequest& request,
                                          const CancellationToken& token) const {
    validate(request);
    const auto start = Clock::now();
    auto& metrics = Metrics::getInstance();
    metrics.increment_counter("search_requests");

    const std::size_t limit = request.top_k * options_.candidate_multiplier;

    std::vector<Branch> branches(2);
    branches[0].source = RetrievalSource::kDense;
    branches[1].source = RetrievalSource::kSparse;

    // Admission happens here, before anything is scheduled, so a HalfOpen
    // breaker lets exactly one branch through as its trial.
    for (auto& branch : branches) {
        branch.report.source = branch.source;
        try {
            branch.permit.emplace(breaker_->acquire());
        } catch (const CircuitOpenError& e) {
            branch.report.status = BranchStatus::kCircuitOpen;
            branch.report.detail = e.what();
        }
    }

    std::vector<BoundedOperation<Documents>> operations;
    for (auto& branch : branches) {
        if (!branch.permit) {
            continue;
        }
        BoundedOperation<Documents> op;
        op.name = to_string(branch.source);
        if (branch.source == RetrievalSource::kDense) {
            op.sub_budget = options_.dense_budget;
            op.call = [retriever = dense_, tenant = request.tenant_id, query = request.query,
                       limit](const CancellationToken& t) {
                return retriever->query_dense(tenant, query, limit, t);
            };
        } else {
            op.sub_budget = options_.sparse_budget;
            op.call = [retriever = sparse_, tenant = request.tenant_id, query = request.query,
                       limit](const CancellationToken& t) {
                return retriever->query_sparse(tenant, query, limit, t);
            };
        }
        branch.slot = operations.size();
        operations.push_back(std::move(op));
    }

    auto results = guard_.run_bounded(std::move(operations), token);

    std::vector<RankedList> lists;
    std::unordered_map<std::string, const RetrievedDocument*> payloads;
    bool any_usable = false;

    for (auto& branch : branches) {
        if (branch.slot) {
            auto& outcome = results.outcomes[*branch.slot];
            branch.report.status = to_branch_status(outcome.status);

            switch (outcome.status) {
                case OutcomeStatus::kCompleted:
                    branch.permit->succeed();
                    break;
                case OutcomeStatus::kCancelled:
                    // Caller gave up; says nothing about the store.
                    branch.permit->release();
                    break;
                case OutcomeStatus::kTimedOut:
                    // A call that never started says nothing about the store.
                    if (outcome.started) {
                        branch.permit->fail();
                    } else {
                        branch.permit->release();
                    }
                    break;
                case OutcomeStatus::kFailed:
                    branch.permit->fail();
                    break;
            }

            if (outcome.completed()) {
                any_usable = true;
                const Documents& documents = *outcome.value;
                branch.report.hit_count = documents.size();
                lists.push_back(to_ranked_list(documents, branch.source));
                // Dense is visited first, so its payload wins for shared documents.
                for (const auto& doc : documents) {
                    payloads.emplace(doc.document_id, &doc);
                }
            } else if (outcome.status == OutcomeStatus::kTimedOut) {
                branch.report.detail = RetrievalTimeout("exceeded sub-deadline after " +
                                                            std::to_string(static_cast<long>(outcome.elapsed_ms)) +
                                                            " ms",
                                                        to_string(branch.source))
                                           .what();
            } else {
                branch.report.detail = describe(outcome.error);
            }
        }

        metrics.increment_counter("branch_outcomes",
                                  {{"source", to_string(branch.source)},
                                   {"status", to_string(branch.report.status)}});
        if (branch.report.status != BranchStatus::kOk) {
            HYBRIDRAG_LOG_WARN("search tenant={} branch={} status={}: {}", request.tenant_id,
                               to_string(branch.source), to_string(branch.report.status),
                               branch.report.detail);
        }
    }

    if (!any_usable) {
        if (token.is_cancelled()) {
            throw CancelledError("search cancelled by caller", request.tenant_id);
        }
        metrics.increment_counter("retrieval_failures");
        HYBRIDRAG_LOG_ERROR("search tenant={}: every retrieval branch failed", request.tenant_id);
        std::string detail;
        for (const auto& branch : branches) {
            if (!detail.empty()) detail += "; ";
            detail += std::string(to_string(branch.source)) + ": " + to_string(branch.report.status);
        }
        throw RetrievalFailure("all retrieval branches failed (" + detail + ")", request.tenant_id);
    }

    auto fused = fuser_.fuse(lists);
    if (fused.size() > request.top_k) {
        fused.resize(request.top_k);
    }

    SearchResponse response;
    response.hits.reserve(fused.size());
    for (auto& result : fused) {
        SearchHit hit;
        hit.document_id = result.document_id;
        hit.score = result.fused_score;
        hit.sources = result.sources();
        auto payload = payloads.find(result.document_id);
        if (payload != payloads.end()) {
            hit.content = payload->second->content;
            hit.metadata = payload->second->metadata;
        }
        response.hits.push_back(std::move(hit));
    }
    for (auto& branch : branches) {
        response.branches.push_back(std::move(branch.report));
    }
    response.latency_ms = elapsed_ms(start);

    metrics.record_histogram("search_latency_ms", response.latency_ms);
    HYBRIDRAG_LOG_DEBUG("search tenant={} hits={} latency={:.1f}ms", request.tenant_id,
                        response.hits.size(), response.latency_ms);
    return response;
}

} // namespace hybridrag
