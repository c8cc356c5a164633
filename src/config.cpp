#include "hybridrag/config.hpp"
#include "hybridrag/error.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace hybridrag {
namespace {

template<typename T>
void read(const YAML::Node& section, const char* key, T& out, const std::string& path) {
    const YAML::Node value = section[key];
    if (!value) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("invalid value for '" + path + "." + key + "': " + e.msg, path);
    }
}

void read_breaker(const YAML::Node& node, BreakerConfig& out, const std::string& path) {
    if (!node) {
        return;
    }
    read(node, "failure_threshold", out.failure_threshold, path);
    std::int64_t cooldown_ms = out.cooldown.count();
    read(node, "cooldown_ms", cooldown_ms, path);
    out.cooldown = std::chrono::milliseconds(cooldown_ms);
}

void apply_yaml(const YAML::Node& yaml, Config& config) {
    if (!yaml || yaml.IsNull()) {
        return;
    }
    if (!yaml.IsMap()) {
        throw ConfigurationError("configuration root must be a mapping");
    }

    if (yaml["logging"]) {
        const auto& log = yaml["logging"];
        read(log, "level", config.logging.level, "logging");
        read(log, "file", config.logging.file, "logging");
        read(log, "console", config.logging.console, "logging");
    }

    read(yaml, "worker_threads", config.worker_threads, "root");

    if (yaml["retrieval"]) {
        const auto& r = yaml["retrieval"];
        read(r, "search_timeout_ms", config.retrieval.search_timeout_ms, "retrieval");
        read(r, "dense_timeout_ms", config.retrieval.dense_timeout_ms, "retrieval");
        read(r, "sparse_timeout_ms", config.retrieval.sparse_timeout_ms, "retrieval");
        read(r, "rrf_k", config.retrieval.rrf_k, "retrieval");
        read(r, "default_top_k", config.retrieval.default_top_k, "retrieval");
        read(r, "max_top_k", config.retrieval.max_top_k, "retrieval");
        read(r, "candidate_multiplier", config.retrieval.candidate_multiplier, "retrieval");
    }

    if (yaml["summary"]) {
        const auto& s = yaml["summary"];
        read(s, "llm_timeout_ms", config.summary.llm_timeout_ms, "summary");
        read(s, "context_results", config.summary.context_results, "summary");
    }

    if (yaml["breakers"]) {
        const auto& b = yaml["breakers"];
        read_breaker(b["vector_store"], config.breakers.vector_store, "breakers.vector_store");
        read_breaker(b["generative"], config.breakers.generative, "breakers.generative");
    }

    if (yaml["vector_store"]) {
        const auto& v = yaml["vector_store"];
        read(v, "host", config.vector_store.host, "vector_store");
        read(v, "port", config.vector_store.port, "vector_store");
        read(v, "use_tls", config.vector_store.use_tls, "vector_store");
        read(v, "api_key", config.vector_store.api_key, "vector_store");
        read(v, "collection", config.vector_store.collection, "vector_store");
        read(v, "timeout_ms", config.vector_store.timeout_ms, "vector_store");
    }

    if (yaml["embedding"]) {
        const auto& e = yaml["embedding"];
        read(e, "host", config.embedding.host, "embedding");
        read(e, "port", config.embedding.port, "embedding");
        read(e, "use_tls", config.embedding.use_tls, "embedding");
        read(e, "api_key", config.embedding.api_key, "embedding");
        read(e, "model", config.embedding.model, "embedding");
        read(e, "dimension", config.embedding.dimension, "embedding");
        read(e, "timeout_ms", config.embedding.timeout_ms, "embedding");
    }

    if (yaml["generative"]) {
        const auto& g = yaml["generative"];
        read(g, "provider", config.generative.provider, "generative");
        read(g, "model", config.generative.model, "generative");
        read(g, "api_key", config.generative.api_key, "generative");
        read(g, "host", config.generative.host, "generative");
        read(g, "port", config.generative.port, "generative");
        read(g, "use_tls", config.generative.use_tls, "generative");
        read(g, "base_path", config.generative.base_path, "generative");
        read(g, "ollama_base_url", config.generative.ollama_base_url, "generative");
        read(g, "max_tokens", config.generative.max_tokens, "generative");
        read(g, "temperature", config.generative.temperature, "generative");
        read(g, "timeout_ms", config.generative.timeout_ms, "generative");
    }
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template<typename T>
T parse_env_number(const char* name, const char* text) {
    try {
        std::size_t consumed = 0;
        if constexpr (std::is_floating_point_v<T>) {
            double value = std::stod(text, &consumed);
            if (text[consumed] != '\0') throw std::invalid_argument(text);
            return static_cast<T>(value);
        } else {
            unsigned long long value = std::stoull(text, &consumed);
            if (text[consumed] != '\0' || text[0] == '-') throw std::invalid_argument(text);
            if (value > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                throw std::out_of_range(text);
            }
            return static_cast<T>(value);
        }
    } catch (const std::out_of_range&) {
        throw ConfigurationError(std::string("environment variable is out of range: ") + text, name);
    } catch (const std::logic_error&) {
        throw ConfigurationError(std::string("environment variable is not a number: ") + text, name);
    }
}

// "http://host:port[/path]" -> host, port, tls, path
void split_base_url(const std::string& url, GenerativeConfig& out) {
    std::string rest = url;
    bool tls = false;
    if (rest.rfind("https://", 0) == 0) {
        tls = true;
        rest = rest.substr(8);
    } else if (rest.rfind("http://", 0) == 0) {
        rest = rest.substr(7);
    } else {
        throw ConfigurationError("base url must start with http:// or https://", url);
    }

    std::string path;
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        path = rest.substr(slash);
        rest = rest.substr(0, slash);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    std::uint16_t port = tls ? 443 : 80;
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        port = parse_env_number<std::uint16_t>("generative.ollama_base_url", rest.substr(colon + 1).c_str());
        rest = rest.substr(0, colon);
    }
    HYBRIDRAG_CHECK(!rest.empty(), ErrorCode::CONFIGURATION_INVALID, "base url without host: " + url);

    out.host = rest;
    out.port = port;
    out.use_tls = tls;
    if (out.base_path.empty()) {
        out.base_path = path;
    }
}

} // namespace

void resolve_provider_endpoint(GenerativeConfig& config) {
    if (!config.host.empty()) {
        if (config.port == 0) {
            config.port = config.use_tls ? 443 : 80;
        }
        if (config.base_path.empty()) {
            config.base_path = "/v1";
        }
        return;
    }

    if (config.provider == "groq") {
        config.host = "api.groq.com";
        config.port = 443;
        config.use_tls = true;
        if (config.base_path.empty()) config.base_path = "/openai/v1";
    } else if (config.provider == "openai") {
        config.host = "api.openai.com";
        config.port = 443;
        config.use_tls = true;
        if (config.base_path.empty()) config.base_path = "/v1";
    } else if (config.provider == "ollama") {
        const bool derive_path = config.base_path.empty();
        split_base_url(config.ollama_base_url, config);
        if (derive_path) {
            config.base_path += "/v1";
        }
        if (config.api_key.empty()) {
            // Ollama ignores the key but the OpenAI wire format expects one.
            config.api_key = "ollama";
        }
    } else {
        throw ConfigurationError("unknown LLM provider '" + config.provider + "'", "generative.provider");
    }
}

void apply_environment_overrides(Config& config) {
    if (const char* v = env("HYBRIDRAG_LOG_LEVEL")) config.logging.level = v;
    if (const char* v = env("HYBRIDRAG_QDRANT_HOST")) config.vector_store.host = v;
    if (const char* v = env("HYBRIDRAG_QDRANT_PORT")) {
        config.vector_store.port = parse_env_number<std::uint16_t>("HYBRIDRAG_QDRANT_PORT", v);
    }
    if (const char* v = env("HYBRIDRAG_COLLECTION")) config.vector_store.collection = v;
    if (const char* v = env("HYBRIDRAG_LLM_PROVIDER")) config.generative.provider = v;
    if (const char* v = env("HYBRIDRAG_LLM_MODEL")) config.generative.model = v;
    if (const char* v = env("HYBRIDRAG_LLM_API_KEY")) config.generative.api_key = v;
    if (const char* v = env("HYBRIDRAG_SEARCH_TIMEOUT_MS")) {
        config.retrieval.search_timeout_ms = parse_env_number<std::uint32_t>("HYBRIDRAG_SEARCH_TIMEOUT_MS", v);
    }
    if (const char* v = env("HYBRIDRAG_LLM_TIMEOUT_MS")) {
        config.summary.llm_timeout_ms = parse_env_number<std::uint32_t>("HYBRIDRAG_LLM_TIMEOUT_MS", v);
    }
    if (const char* v = env("HYBRIDRAG_RRF_K")) {
        config.retrieval.rrf_k = parse_env_number<double>("HYBRIDRAG_RRF_K", v);
    }
}

void validate_config(const Config& config) {
    auto require = [](bool ok, const std::string& message, const std::string& key) {
        if (!ok) {
            throw ConfigurationError(message, key);
        }
    };

    parse_log_level(config.logging.level);
    require(config.worker_threads > 0, "worker_threads must be positive", "worker_threads");

    const auto& r = config.retrieval;
    require(r.search_timeout_ms > 0, "search budget must be positive", "retrieval.search_timeout_ms");
    require(std::isfinite(r.rrf_k) && r.rrf_k > 0.0, "rrf_k must be positive", "retrieval.rrf_k");
    require(r.max_top_k >= 1, "max_top_k must be at least 1", "retrieval.max_top_k");
    require(r.default_top_k >= 1 && r.default_top_k <= r.max_top_k,
            "default_top_k must be within [1, max_top_k]", "retrieval.default_top_k");
    require(r.candidate_multiplier >= 1, "candidate_multiplier must be at least 1",
            "retrieval.candidate_multiplier");

    require(config.summary.llm_timeout_ms > 0, "generation budget must be positive", "summary.llm_timeout_ms");
    require(config.summary.context_results >= 1, "context_results must be at least 1",
            "summary.context_results");

    require(config.breakers.vector_store.failure_threshold > 0, "failure_threshold must be positive",
            "breakers.vector_store.failure_threshold");
    require(config.breakers.vector_store.cooldown.count() >= 0, "cooldown_ms must not be negative",
            "breakers.vector_store.cooldown_ms");
    require(config.breakers.generative.failure_threshold > 0, "failure_threshold must be positive",
            "breakers.generative.failure_threshold");
    require(config.breakers.generative.cooldown.count() >= 0, "cooldown_ms must not be negative",
            "breakers.generative.cooldown_ms");

    require(!config.vector_store.host.empty(), "vector store host is required", "vector_store.host");
    require(config.vector_store.port != 0, "vector store port is required", "vector_store.port");
    require(!config.vector_store.collection.empty(), "collection is required", "vector_store.collection");
    require(config.embedding.dimension > 0, "embedding dimension must be positive", "embedding.dimension");

    const auto& provider = config.generative.provider;
    require(provider == "openai" || provider == "groq" || provider == "ollama",
            "unknown LLM provider '" + provider + "'", "generative.provider");
    require(config.generative.temperature >= 0.0 && config.generative.temperature <= 2.0,
            "temperature must be within [0, 2]", "generative.temperature");
    require(config.generative.max_tokens > 0, "max_tokens must be positive", "generative.max_tokens");
}

Config parse_config(const std::string& yaml_text) {
    Config config;
    try {
        apply_yaml(YAML::Load(yaml_text), config);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("malformed configuration: " + e.msg);
    }
    validate_config(config);
    return config;
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    // Load from YAML file if it exists
    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            apply_yaml(YAML::LoadFile(config_file), config);
        } catch (const YAML::Exception& e) {
            throw ConfigurationError("malformed configuration: " + e.msg, config_file);
        }
        HYBRIDRAG_LOG_INFO("loaded configuration from {}", config_file);
    } else if (!config_file.empty()) {
        HYBRIDRAG_LOG_WARN("configuration file {} not found, using defaults", config_file);
    }

    apply_environment_overrides(config);
    validate_config(config);
    return config;
}

} // namespace hybridrag
