#pragma once

#include "hybridrag/circuit_breaker.hpp"
#include "hybridrag/logging.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace hybridrag {

struct RetrievalConfig {
    std::uint32_t search_timeout_ms = 800;
    // 0 means the branch only gets the overall search budget.
    std::uint32_t dense_timeout_ms = 0;
    std::uint32_t sparse_timeout_ms = 0;
    double rrf_k = 60.0;
    std::size_t default_top_k = 5;
    std::size_t max_top_k = 100;
    // Each branch asks the store for top_k * candidate_multiplier documents.
    std::size_t candidate_multiplier = 2;
};

struct SummaryConfig {
    std::uint32_t llm_timeout_ms = 2000;
    std::size_t context_results = 5;
};

struct BreakersConfig {
    BreakerConfig vector_store{5, std::chrono::milliseconds(30000)};
    BreakerConfig generative{3, std::chrono::milliseconds(30000)};
};

struct VectorStoreConfig {
    std::string host = "localhost";
    std::uint16_t port = 6333;
    bool use_tls = false;
    std::string api_key;
    std::string collection = "rag_documents";
    std::uint32_t timeout_ms = 5000;
};

struct EmbeddingConfig {
    std::string host = "localhost";
    std::uint16_t port = 8711;
    bool use_tls = false;
    std::string api_key;
    std::string model = "sentence-transformers/all-MiniLM-L6-v2";
    std::size_t dimension = 384;
    std::uint32_t timeout_ms = 10000;
};

struct GenerativeConfig {
    std::string provider = "groq";  // openai | groq | ollama
    std::string model = "llama-3-8b-8192";
    std::string api_key;
    // Empty host means: derive host, port, TLS and base path from provider.
    std::string host;
    std::uint16_t port = 0;
    bool use_tls = false;
    std::string base_path;
    std::string ollama_base_url = "http://localhost:11434";
    std::uint32_t max_tokens = 200;
    double temperature = 0.7;
    std::uint32_t timeout_ms = 30000;
};

struct Config {
    LoggingConfig logging;
    std::size_t worker_threads = 8;  // core pool size; overflow workers start on demand
    RetrievalConfig retrieval;
    SummaryConfig summary;
    BreakersConfig breakers;
    VectorStoreConfig vector_store;
    EmbeddingConfig embedding;
    GenerativeConfig generative;
    std::string config_file;
};

/**
 * Load configuration: defaults, then the YAML file (if it exists), then
 * HYBRIDRAG_* environment overrides, then validation.
 *
 * A missing file is not an error. A malformed file, a value of the wrong
 * type or a value out of range throws ConfigurationError.
 */
Config load_config(const std::string& config_file = "hybridrag.yaml");

// Same as load_config but from YAML text; no environment overrides.
Config parse_config(const std::string& yaml_text);

void apply_environment_overrides(Config& config);

// Throws ConfigurationError describing the first invalid value.
void validate_config(const Config& config);

// Fills generative host/port/TLS/base path from the provider when unset.
void resolve_provider_endpoint(GenerativeConfig& config);

} // namespace hybridrag
