#include "hybridrag/clients/qdrant_client.hpp"
#include "hybridrag/clients/json_util.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/logging.hpp"

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>

namespace json = boost::json;

namespace hybridrag {
namespace {

// Fixed namespace so point ids are stable across processes.
const boost::uuids::uuid& point_namespace() {
    static const boost::uuids::uuid ns =
        boost::uuids::string_generator()("6f1c2b52-3d0e-5a8f-9c4b-2e7d1a0f8b63");
    return ns;
}

// Leading 32 bits of the MD5 digest, as the stored sparse vectors were built.
std::uint32_t term_index(const std::string& term) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(term.data(), term.size(), digest, &length, EVP_md5(), nullptr) != 1 || length < 4) {
        throw HybridRagException(ErrorCode::INTERNAL_ERROR, "MD5 digest failed", "sparse vector");
    }
    const std::uint32_t prefix = (static_cast<std::uint32_t>(digest[0]) << 24) |
                                 (static_cast<std::uint32_t>(digest[1]) << 16) |
                                 (static_cast<std::uint32_t>(digest[2]) << 8) |
                                 static_cast<std::uint32_t>(digest[3]);
    return prefix % QdrantVectorStore::kSparseIndexSpace;
}

json::value sparse_to_json(const SparseVector& sparse) {
    json::array indices;
    json::array values;
    for (std::size_t i = 0; i < sparse.indices.size(); ++i) {
        indices.emplace_back(sparse.indices[i]);
        values.emplace_back(static_cast<double>(sparse.values[i]));
    }
    return json::object{{"indices", std::move(indices)}, {"values", std::move(values)}};
}

json::value dense_to_json(const std::vector<float>& dense) {
    json::array values;
    values.reserve(dense.size());
    for (float v : dense) {
        values.emplace_back(static_cast<double>(v));
    }
    return values;
}

} // namespace

QdrantVectorStore::QdrantVectorStore(std::shared_ptr<HttpClient> http_client,
                                     std::shared_ptr<Embedder> embedder,
                                     std::string collection,
                                     std::string api_key)
    : http_client_(std::move(http_client))
    , embedder_(std::move(embedder))
    , collection_(std::move(collection))
    , api_key_(std::move(api_key)) {
    HYBRIDRAG_CHECK_ARGUMENT(http_client_, "http client is required");
    HYBRIDRAG_CHECK_ARGUMENT(embedder_, "embedder is required");
    HYBRIDRAG_CHECK_ARGUMENT(!collection_.empty(), "collection name is required");
}

SparseVector QdrantVectorStore::make_sparse_vector(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    std::map<std::uint32_t, float> weights;
    std::istringstream words(lowered);
    std::string word;
    while (words >> word) {
        // Terms that collide in the index space share one slot.
        weights[term_index(word)] += 1.0f;
    }

    SparseVector sparse;
    sparse.indices.reserve(weights.size());
    sparse.values.reserve(weights.size());
    for (const auto& entry : weights) {
        sparse.indices.push_back(entry.first);
        sparse.values.push_back(entry.second);
    }
    return sparse;
}

std::string QdrantVectorStore::point_id(const std::string& tenant_id, const std::string& document_id) {
    boost::uuids::name_generator_sha1 generator(point_namespace());
    return boost::uuids::to_string(generator(tenant_id + '\x1f' + document_id));
}

json::object QdrantVectorStore::tenant_filter(const std::string& tenant_id) {
    json::object match{{"value", tenant_id}};
    json::object condition{{"key", "tenant_id"}, {"match", std::move(match)}};
    json::array must;
    must.emplace_back(std::move(condition));
    return json::object{{"must", std::move(must)}};
}

std::string QdrantVectorStore::build_search_request(const std::string& vector_name, json::value vector,
                                                    const std::string& tenant_id, std::size_t limit) {
    json::object root;
    root["vector"] = json::object{{"name", vector_name}, {"vector", std::move(vector)}};
    root["filter"] = tenant_filter(tenant_id);
    root["limit"] = limit;
    root["with_payload"] = true;
    return json::serialize(root);
}

std::string QdrantVectorStore::build_collection_request(std::size_t dimension) {
    json::object dense{{"size", dimension}, {"distance", "Cosine"}};
    json::object root;
    root["vectors"] = json::object{{"dense", std::move(dense)}};
    root["sparse_vectors"] = json::object{{"sparse", json::object{}}};
    return json::serialize(root);
}

std::string QdrantVectorStore::build_upsert_request(const DocumentInput& document,
                                                    const std::vector<float>& dense) {
    json::object metadata;
    for (const auto& entry : document.metadata) {
        metadata[entry.first] = entry.second;
    }

    json::object point;
    point["id"] = point_id(document.tenant_id, document.document_id);
    point["vector"] = json::object{{"dense", dense_to_json(dense)},
                                   {"sparse", sparse_to_json(make_sparse_vector(document.content))}};
    point["payload"] = json::object{{"tenant_id", document.tenant_id},
                                    {"document_id", document.document_id},
                                    {"content", document.content},
                                    {"metadata", std::move(metadata)}};

    json::array points;
    points.emplace_back(std::move(point));
    return json::serialize(json::object{{"points", std::move(points)}});
}

std::vector<RetrievedDocument> QdrantVectorStore::parse_search_response(const std::string& body,
                                                                        const std::string& tenant_id) {
    const json::value root = json_util::parse(body, "search response");
    const auto& hits = json_util::array_at(
        json_util::field(json_util::object_at(root, "search response"), "result", "search response"),
        "search result");

    std::vector<RetrievedDocument> documents;
    documents.reserve(hits.size());
    for (const auto& hit_value : hits) {
        const auto& hit = json_util::object_at(hit_value, "search hit");
        auto payload_it = hit.find("payload");
        if (payload_it == hit.end() || !payload_it->value().is_object()) {
            HYBRIDRAG_LOG_WARN("qdrant: skipping hit without payload");
            continue;
        }
        const auto& payload = payload_it->value().get_object();

        if (json_util::string_or(payload, "tenant_id") != tenant_id) {
            HYBRIDRAG_LOG_ERROR("qdrant: dropping hit from foreign tenant in results for tenant {}", tenant_id);
            continue;
        }

        RetrievedDocument doc;
        doc.document_id = json_util::string_or(payload, "document_id");
        if (doc.document_id.empty()) {
            HYBRIDRAG_LOG_WARN("qdrant: skipping hit without document_id");
            continue;
        }
        doc.content = json_util::string_or(payload, "content");
        if (auto it = hit.find("score"); it != hit.end()) {
            doc.raw_score = json_util::number(it->value(), "search score");
        }
        if (auto it = payload.find("metadata"); it != payload.end() && it->value().is_object()) {
            for (const auto& entry : it->value().get_object()) {
                doc.metadata[std::string(entry.key())] = json_util::scalar_to_string(entry.value());
            }
        }
        doc.rank = static_cast<std::uint32_t>(documents.size() + 1);
        documents.push_back(std::move(doc));
    }
    return documents;
}

HttpResponse QdrantVectorStore::call(const std::string& method, const std::string& target,
                                     const std::string& body, const CancellationToken& token) {
    HttpRequest request;
    request.method = method;
    request.target = target;
    request.body = body;
    if (!api_key_.empty()) {
        request.headers["api-key"] = api_key_;
    }
    return http_client_->send(request, token);
}

void QdrantVectorStore::expect_ok(const HttpResponse& response, const std::string& what) const {
    if (!response.ok()) {
        throw TransportError(ErrorCode::HTTP_STATUS,
                             "qdrant " + what + " returned HTTP " + std::to_string(response.status),
                             response.body.substr(0, 256));
    }
}

std::vector<RetrievedDocument> QdrantVectorStore::search(const std::string& vector_name, json::value vector,
                                                         const std::string& tenant_id, std::size_t limit,
                                                         const CancellationToken& token) {
    auto response = call("POST", "/collections/" + collection_ + "/points/search",
                         build_search_request(vector_name, std::move(vector), tenant_id, limit), token);
    expect_ok(response, vector_name + " search");
    return parse_search_response(response.body, tenant_id);
}

std::vector<RetrievedDocument> QdrantVectorStore::query_dense(const std::string& tenant_id,
                                                              const std::string& query_text,
                                                              std::size_t limit,
                                                              const CancellationToken& token) {
    auto vectors = embedder_->embed({query_text}, token);
    if (vectors.empty()) {
        throw ProtocolError("embedder returned no vector for the query");
    }
    token.throw_if_cancelled();
    return search("dense", dense_to_json(vectors.front()), tenant_id, limit, token);
}

std::vector<RetrievedDocument> QdrantVectorStore::query_sparse(const std::string& tenant_id,
                                                               const std::string& query_text,
                                                               std::size_t limit,
                                                               const CancellationToken& token) {
    SparseVector sparse = make_sparse_vector(query_text);
    if (sparse.indices.empty()) {
        return {};
    }
    return search("sparse", sparse_to_json(sparse), tenant_id, limit, token);
}

bool QdrantVectorStore::ensure_collection(const CancellationToken& token) {
    auto existing = call("GET", "/collections/" + collection_, "", token);
    if (existing.ok()) {
        HYBRIDRAG_LOG_INFO("qdrant: collection '{}' already exists", collection_);
        return false;
    }
    if (existing.status != 404) {
        expect_ok(existing, "collection lookup");
    }

    HYBRIDRAG_LOG_INFO("qdrant: creating collection '{}'", collection_);
    auto created = call("PUT", "/collections/" + collection_,
                        build_collection_request(embedder_->dimension()), token);
    expect_ok(created, "create collection");
    return true;
}

void QdrantVectorStore::upsert_document(const DocumentInput& document, const CancellationToken& token) {
    HYBRIDRAG_CHECK_ARGUMENT(!document.tenant_id.empty(), "tenant_id is required");
    HYBRIDRAG_CHECK_ARGUMENT(!document.document_id.empty(), "document_id is required");

    auto vectors = embedder_->embed({document.content}, token);
    if (vectors.empty()) {
        throw ProtocolError("embedder returned no vector for the document");
    }

    auto response = call("PUT", "/collections/" + collection_ + "/points?wait=true",
                         build_upsert_request(document, vectors.front()), token);
    expect_ok(response, "upsert");
    HYBRIDRAG_LOG_INFO("qdrant: stored document {} for tenant {}", document.document_id, document.tenant_id);
}

std::uint64_t QdrantVectorStore::delete_by_tenant(const std::string& tenant_id, const CancellationToken& token) {
    HYBRIDRAG_CHECK_ARGUMENT(!tenant_id.empty(), "tenant_id is required");

    json::object count_request{{"filter", tenant_filter(tenant_id)}, {"exact", true}};
    auto counted = call("POST", "/collections/" + collection_ + "/points/count",
                        json::serialize(count_request), token);
    expect_ok(counted, "count");

    const json::value root = json_util::parse(counted.body, "count response");
    const auto& result = json_util::object_at(
        json_util::field(json_util::object_at(root, "count response"), "result", "count response"),
        "count result");
    const auto count = static_cast<std::uint64_t>(json_util::number(json_util::field(result, "count", "count result"),
                                                                    "count"));
    if (count == 0) {
        return 0;
    }

    json::object delete_request{{"filter", tenant_filter(tenant_id)}};
    auto deleted = call("POST", "/collections/" + collection_ + "/points/delete?wait=true",
                        json::serialize(delete_request), token);
    expect_ok(deleted, "delete");

    HYBRIDRAG_LOG_INFO("qdrant: deleted {} documents for tenant {}", count, tenant_id);
    return count;
}

bool QdrantVectorStore::health_check(const CancellationToken& token) {
    try {
        return call("GET", "/collections", "", token).ok();
    } catch (const TransportError& e) {
        HYBRIDRAG_LOG_ERROR("qdrant health check failed: {}", e.what());
        return false;
    }
}

} // namespace hybridrag
