#pragma once

#include "hybridrag/cancellation.hpp"
#include "hybridrag/circuit_breaker.hpp"
#include "hybridrag/clients/embedding_client.hpp"
#include "hybridrag/clients/generative_client.hpp"
#include "hybridrag/clients/http_client.hpp"
#include "hybridrag/clients/qdrant_client.hpp"
#include "hybridrag/config.hpp"
#include "hybridrag/search_orchestrator.hpp"
#include "hybridrag/summary_pipeline.hpp"
#include "hybridrag/task_pool.hpp"
#include "hybridrag/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hybridrag {

// Transport for each downstream service. Unset entries are built from Config.
struct ServiceTransports {
    std::shared_ptr<HttpClient> vector_store;
    std::shared_ptr<HttpClient> embedding;
    std::shared_ptr<HttpClient> generative;
};

struct HealthReport {
    std::string status;  // "healthy" | "degraded"
    bool vector_store_connected = false;
    std::vector<BreakerSnapshot> breakers;
    std::map<std::string, std::string> details;

    bool healthy() const { return status == "healthy"; }
};

/**
 * Composition root: owns the worker pool, one circuit breaker per
 * dependency, the service adapters and the two pipelines. Built once per
 * process and shared by every request.
 */
class RagService {
public:
    explicit RagService(Config config, ServiceTransports transports = {});
    ~RagService();

    RagService(const RagService&) = delete;
    RagService& operator=(const RagService&) = delete;

    // Creates the vector collection when it does not exist yet.
    void initialize(const CancellationToken& token = {});

    // top_k of 0 selects the configured default.
    SearchResponse search(SearchRequest request, const CancellationToken& token = {}) const;

    SummaryResponse search_with_summary(SearchRequest request,
                                        const FragmentCallback& on_fragment = {},
                                        const CancellationToken& token = {}) const;

    // Embeds and stores the document behind the vector-store breaker.
    void ingest_document(const DocumentInput& document, const CancellationToken& token = {});

    // Removes every document of the tenant; returns how many were removed.
    std::uint64_t delete_tenant(const std::string& tenant_id, const CancellationToken& token = {});

    HealthReport health(const CancellationToken& token = {}) const;

    std::string metrics_text() const;

    const Config& config() const { return config_; }
    CircuitBreaker& vector_store_breaker() { return *vector_store_breaker_; }
    CircuitBreaker& generative_breaker() { return *generative_breaker_; }

private:
    SearchRequest with_defaults(SearchRequest request) const;

    Config config_;
    // Declared first so it outlives every component that posts work to it.
    TaskPool pool_;
    std::shared_ptr<CircuitBreaker> vector_store_breaker_;
    std::shared_ptr<CircuitBreaker> generative_breaker_;
    std::shared_ptr<EmbeddingClient> embedder_;
    std::shared_ptr<QdrantVectorStore> store_;
    std::shared_ptr<GenerativeClient> generator_;
    std::shared_ptr<SearchOrchestrator> orchestrator_;
    std::unique_ptr<SummaryPipeline> pipeline_;
};

} // namespace hybridrag
