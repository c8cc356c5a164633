#pragma once

#include "hybridrag/clients/http_client.hpp"
#include "hybridrag/collaborators.hpp"
#include "hybridrag/types.hpp"

#include <boost/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hybridrag {

// Hashed term-frequency vector used for keyword retrieval.
struct SparseVector {
    std::vector<std::uint32_t> indices;  // ascending, unique
    std::vector<float> values;
};

/**
 * Qdrant REST adapter providing both retrieval strategies over one
 * collection with two named vectors: "dense" (cosine) and "sparse".
 *
 * Every point carries tenant_id in its payload and every search and delete
 * is filtered by it. As a second line of defence, hits whose payload names
 * another tenant are dropped when parsing.
 */
class QdrantVectorStore : public DenseRetriever, public SparseRetriever {
public:
    static constexpr std::uint32_t kSparseIndexSpace = 10000;

    QdrantVectorStore(std::shared_ptr<HttpClient> http_client,
                      std::shared_ptr<Embedder> embedder,
                      std::string collection,
                      std::string api_key = "");

    std::vector<RetrievedDocument> query_dense(const std::string& tenant_id,
                                               const std::string& query_text,
                                               std::size_t limit,
                                               const CancellationToken& token) override;

    std::vector<RetrievedDocument> query_sparse(const std::string& tenant_id,
                                                const std::string& query_text,
                                                std::size_t limit,
                                                const CancellationToken& token) override;

    // Creates the collection when missing. Returns true if it was created.
    bool ensure_collection(const CancellationToken& token = {});

    // Embeds and stores one document; re-ingesting the same id overwrites it.
    void upsert_document(const DocumentInput& document, const CancellationToken& token = {});

    // Returns how many points were removed.
    std::uint64_t delete_by_tenant(const std::string& tenant_id, const CancellationToken& token = {});

    bool health_check(const CancellationToken& token = {});

    const std::string& collection() const { return collection_; }

    // Wire helpers, exposed for tests.
    static SparseVector make_sparse_vector(const std::string& text);
    static std::string point_id(const std::string& tenant_id, const std::string& document_id);
    static boost::json::object tenant_filter(const std::string& tenant_id);
    static std::string build_search_request(const std::string& vector_name, boost::json::value vector,
                                            const std::string& tenant_id, std::size_t limit);
    static std::string build_collection_request(std::size_t dimension);
    static std::string build_upsert_request(const DocumentInput& document, const std::vector<float>& dense);
    static std::vector<RetrievedDocument> parse_search_response(const std::string& body,
                                                                const std::string& tenant_id);

private:
    std::vector<RetrievedDocument> search(const std::string& vector_name, boost::json::value vector,
                                          const std::string& tenant_id, std::size_t limit,
                                          const CancellationToken& token);
    HttpResponse call(const std::string& method, const std::string& target, const std::string& body,
                      const CancellationToken& token);
    void expect_ok(const HttpResponse& response, const std::string& what) const;

    std::shared_ptr<HttpClient> http_client_;
    std::shared_ptr<Embedder> embedder_;
    std::string collection_;
    std::string api_key_;
};

} // namespace hybridrag
