#pragma once

#include "hybridrag/cancellation.hpp"
#include "hybridrag/circuit_breaker.hpp"
#include "hybridrag/collaborators.hpp"
#include "hybridrag/config.hpp"
#include "hybridrag/search_orchestrator.hpp"
#include "hybridrag/task_pool.hpp"
#include "hybridrag/types.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hybridrag {

struct SummaryOptions {
    std::chrono::milliseconds budget{2000};
    std::size_t context_results = 5;

    static SummaryOptions from_config(const SummaryConfig& config);
};

// Receives each summary fragment as it arrives. Throwing aborts generation.
using FragmentCallback = std::function<void(const std::string& fragment)>;

constexpr const char* kNoResultsSummary = "No search results found to summarize.";
constexpr const char* kSystemPrompt = "You are a helpful assistant that summarizes search results concisely.";

/**
 * Search followed by a best-effort streamed summary.
 *
 * The search stage is the guaranteed contract: its RetrievalFailure is the
 * only error that escapes. The generation stage runs behind its own circuit
 * breaker and budget. Rejection, timeout or backend failure before any
 * output degrades to search results plus a marker; the same after output
 * started marks the summary incomplete and keeps what was streamed.
 */
class SummaryPipeline {
public:
    SummaryPipeline(std::shared_ptr<const SearchOrchestrator> search,
                    std::shared_ptr<GenerativeBackend> backend,
                    std::shared_ptr<CircuitBreaker> generative_breaker,
                    TaskPool& pool,
                    SummaryOptions options = {});

    SummaryResponse search_with_summary(const SearchRequest& request,
                                        const FragmentCallback& on_fragment = {},
                                        const CancellationToken& token = {}) const;

    // Prompt over the first max_results hits, numbered from 1.
    static GenerationPrompt build_prompt(const std::string& query,
                                         const std::vector<SearchHit>& hits,
                                         std::size_t max_results);

    const SummaryOptions& options() const { return options_; }

private:
    struct Generation {
        std::string text;
        SummaryStatus status = SummaryStatus::kComplete;
        DegradationReason reason = DegradationReason::kNone;
        std::string error;
    };

    Generation generate(const GenerationPrompt& prompt, const FragmentCallback& on_fragment,
                        const CancellationToken& token) const;

    std::shared_ptr<const SearchOrchestrator> search_;
    std::shared_ptr<GenerativeBackend> backend_;
    std::shared_ptr<CircuitBreaker> breaker_;
    TaskPool& pool_;
    SummaryOptions options_;
};

// Text placed in SummaryResponse::summary when generation produced nothing.
std::string degraded_summary_marker(DegradationReason reason, const std::string& error = "");

} // namespace hybridrag
