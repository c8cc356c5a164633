#pragma once

#include "hybridrag/cancellation.hpp"
#include "hybridrag/fragment_channel.hpp"
#include "hybridrag/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace hybridrag {

/**
 * Contracts the orchestration core depends on. Implementations must filter
 * strictly by tenant_id, honor the cancellation token by abandoning the
 * underlying I/O, and report failure by throwing.
 */

class DenseRetriever {
public:
    virtual ~DenseRetriever() = default;

    // Ordered best-first; rank is 1-based.
    virtual std::vector<RetrievedDocument> query_dense(const std::string& tenant_id,
                                                       const std::string& query_text,
                                                       std::size_t limit,
                                                       const CancellationToken& token) = 0;
};

class SparseRetriever {
public:
    virtual ~SparseRetriever() = default;

    virtual std::vector<RetrievedDocument> query_sparse(const std::string& tenant_id,
                                                        const std::string& query_text,
                                                        std::size_t limit,
                                                        const CancellationToken& token) = 0;
};

class Embedder {
public:
    virtual ~Embedder() = default;

    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts,
                                                  const CancellationToken& token) = 0;
    virtual std::size_t dimension() const = 0;
};

struct GenerationPrompt {
    std::string system;
    std::string user;
};

class GenerativeBackend {
public:
    virtual ~GenerativeBackend() = default;

    /**
     * Streams the completion into the channel and returns when the stream
     * ends. Implementations push fragments as they arrive, stop when push()
     * returns false or the token is cancelled, and throw on provider errors.
     * The caller closes or fails the channel.
     */
    virtual void generate(const GenerationPrompt& prompt, FragmentChannel& channel,
                          const CancellationToken& token) = 0;
};

} // namespace hybridrag
