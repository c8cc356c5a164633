#include "hybridrag/rag_service.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"
#include "hybridrag/metrics.hpp"

#include <chrono>
#include <utility>

namespace hybridrag {
namespace {

std::shared_ptr<HttpClient> make_transport(const std::string& host, std::uint16_t port, bool use_tls,
                                           std::uint32_t timeout_ms) {
    HttpEndpoint endpoint;
    endpoint.host = host;
    endpoint.port = port;
    endpoint.use_tls = use_tls;
    endpoint.timeout = std::chrono::milliseconds(timeout_ms);
    return std::make_shared<HttpClient>(endpoint);
}

Config prepared(Config config) {
    validate_config(config);
    resolve_provider_endpoint(config.generative);
    return config;
}

} // namespace

RagService::RagService(Config config, ServiceTransports transports)
    : config_(prepared(std::move(config)))
    , pool_(config_.worker_threads) {
    const auto& vs = config_.vector_store;
    const auto& em = config_.embedding;
    const auto& gen = config_.generative;

    if (!transports.vector_store) {
        transports.vector_store = make_transport(vs.host, vs.port, vs.use_tls, vs.timeout_ms);
    }
    if (!transports.embedding) {
        transports.embedding = make_transport(em.host, em.port, em.use_tls, em.timeout_ms);
    }
    if (!transports.generative) {
        transports.generative = make_transport(gen.host, gen.port, gen.use_tls, gen.timeout_ms);
    }

    vector_store_breaker_ = std::make_shared<CircuitBreaker>("vector_store", config_.breakers.vector_store);
    generative_breaker_ = std::make_shared<CircuitBreaker>("generative", config_.breakers.generative);

    embedder_ = std::make_shared<EmbeddingClient>(transports.embedding, em.model, em.dimension, em.api_key);
    store_ = std::make_shared<QdrantVectorStore>(transports.vector_store, embedder_, vs.collection, vs.api_key);
    generator_ = std::make_shared<GenerativeClient>(transports.generative, gen.model, gen.api_key,
                                                    gen.base_path, gen.max_tokens, gen.temperature);

    orchestrator_ = std::make_shared<SearchOrchestrator>(store_, store_, vector_store_breaker_, pool_,
                                                         OrchestratorOptions::from_config(config_.retrieval));
    pipeline_ = std::make_unique<SummaryPipeline>(orchestrator_, generator_, generative_breaker_, pool_,
                                                  SummaryOptions::from_config(config_.summary));

    HYBRIDRAG_LOG_INFO("hybridrag service ready: qdrant {}:{} collection '{}', llm {} ({}), {} core workers",
                       vs.host, vs.port, vs.collection, gen.provider, gen.model, pool_.core_threads());
}

RagService::~RagService() = default;

void RagService::initialize(const CancellationToken& token) {
    const bool created = vector_store_breaker_->execute([&]() { return store_->ensure_collection(token); });
    if (created) {
        HYBRIDRAG_LOG_INFO("created collection '{}'", store_->collection());
    }
}

SearchRequest RagService::with_defaults(SearchRequest request) const {
    if (request.top_k == 0) {
        request.top_k = config_.retrieval.default_top_k;
    }
    return request;
}

SearchResponse RagService::search(SearchRequest request, const CancellationToken& token) const {
    return orchestrator_->search(with_defaults(std::move(request)), token);
}

SummaryResponse RagService::search_with_summary(SearchRequest request, const FragmentCallback& on_fragment,
                                                const CancellationToken& token) const {
    return pipeline_->search_with_summary(with_defaults(std::move(request)), on_fragment, token);
}

void RagService::ingest_document(const DocumentInput& document, const CancellationToken& token) {
    HYBRIDRAG_CHECK_ARGUMENT(!document.tenant_id.empty(), "tenant_id is required");
    HYBRIDRAG_CHECK_ARGUMENT(!document.document_id.empty(), "document_id is required");
    HYBRIDRAG_CHECK_ARGUMENT(!document.content.empty(), "content is required");
    HYBRIDRAG_METRICS_TIMER(ingest_latency_ms);

    vector_store_breaker_->execute([&]() { store_->upsert_document(document, token); });
    Metrics::getInstance().increment_counter("documents_ingested");
}

std::uint64_t RagService::delete_tenant(const std::string& tenant_id, const CancellationToken& token) {
    HYBRIDRAG_CHECK_ARGUMENT(!tenant_id.empty(), "tenant_id is required");
    HYBRIDRAG_METRICS_TIMER(delete_latency_ms);

    const std::uint64_t removed =
        vector_store_breaker_->execute([&]() { return store_->delete_by_tenant(tenant_id, token); });
    Metrics::getInstance().increment_counter("documents_deleted", {}, static_cast<std::int64_t>(removed));
    return removed;
}

HealthReport RagService::health(const CancellationToken& token) const {
    HealthReport report;
    report.vector_store_connected = store_->health_check(token);
    report.breakers.push_back(vector_store_breaker_->snapshot());
    report.breakers.push_back(generative_breaker_->snapshot());

    const bool store_admitted = report.breakers.front().state != BreakerState::kOpen;
    report.status = report.vector_store_connected && store_admitted ? "healthy" : "degraded";

    report.details["qdrant_host"] = config_.vector_store.host;
    report.details["qdrant_port"] = std::to_string(config_.vector_store.port);
    report.details["collection"] = config_.vector_store.collection;
    report.details["embedding_model"] = config_.embedding.model;
    report.details["llm_provider"] = config_.generative.provider;

    if (!report.healthy()) {
        HYBRIDRAG_LOG_WARN("health: degraded (qdrant connected: {}, vector store breaker: {})",
                           report.vector_store_connected, to_string(report.breakers.front().state));
    }
    return report;
}

std::string RagService::metrics_text() const {
    return Metrics::getInstance().export_prometheus();
}

} // namespace hybridrag
