#include "hybridrag/summary_pipeline.hpp"
#include "hybridrag/deadline_guard.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/fragment_channel.hpp"
#include "hybridrag/logging.hpp"
#include "hybridrag/metrics.hpp"

#include <algorithm>
#include <atomic>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace hybridrag {

SummaryOptions SummaryOptions::from_config(const SummaryConfig& config) {
    SummaryOptions options;
    options.budget = std::chrono::milliseconds(config.llm_timeout_ms);
    options.context_results = config.context_results;
    return options;
}

std::string degraded_summary_marker(DegradationReason reason, const std::string& error) {
    switch (reason) {
        case DegradationReason::kCircuitOpen:
            return "Summary service temporarily unavailable. Search results are still available below.";
        case DegradationReason::kTimeout:
            return "Summary generation timed out. Search results are still available below.";
        case DegradationReason::kBackendFailure:
            if (error.empty()) {
                return "Summary generation failed. Search results are still available below.";
            }
            return "Summary generation failed: " + error + ". Search results are still available below.";
        case DegradationReason::kCancelled:
            return "Summary generation cancelled.";
        case DegradationReason::kNone:
            break;
    }
    return "";
}

SummaryPipeline::SummaryPipeline(std::shared_ptr<const SearchOrchestrator> search,
                                 std::shared_ptr<GenerativeBackend> backend,
                                 std::shared_ptr<CircuitBreaker> generative_breaker,
                                 TaskPool& pool,
                                 SummaryOptions options)
    : search_(std::move(search))
    , backend_(std::move(backend))
    , breaker_(std::move(generative_breaker))
    , pool_(pool)
    , options_(options) {
    HYBRIDRAG_CHECK_ARGUMENT(search_, "search orchestrator is required");
    HYBRIDRAG_CHECK_ARGUMENT(backend_, "generative backend is required");
    HYBRIDRAG_CHECK_ARGUMENT(breaker_, "generative breaker is required");
    HYBRIDRAG_CHECK_ARGUMENT(options_.budget.count() > 0, "generation budget must be positive");
    HYBRIDRAG_CHECK_ARGUMENT(options_.context_results >= 1, "context_results must be at least 1");
}

GenerationPrompt SummaryPipeline::build_prompt(const std::string& query,
                                               const std::vector<SearchHit>& hits,
                                               std::size_t max_results) {
    const std::size_t count = std::min(max_results, hits.size());

    std::ostringstream context;
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            context << "\n\n";
        }
        context << '[' << (i + 1) << "] " << hits[i].content;
    }

    GenerationPrompt prompt;
    prompt.system = kSystemPrompt;
    prompt.user = "Based on the following search results, provide a concise summary answering the query: \"" +
                  query + "\"\n\nSearch Results:\n" + context.str() + "\n\nSummary:";
    return prompt;
}

SummaryPipeline::Generation SummaryPipeline::generate(const GenerationPrompt& prompt,
                                                      const FragmentCallback& on_fragment,
                                                      const CancellationToken& token) const {
    Generation result;

    CircuitBreaker::Permit permit;
    try {
        permit = breaker_->acquire();
    } catch (const CircuitOpenError& e) {
        result.status = SummaryStatus::kDegraded;
        result.reason = DegradationReason::kCircuitOpen;
        result.error = e.what();
        return result;
    }

    auto channel = std::make_shared<FragmentChannel>();
    auto started = std::make_shared<std::atomic<bool>>(false);
    CancellationSource source(token);
    const Deadline deadline = Deadline::after(options_.budget);

    try {
        pool_.post([backend = backend_, channel, started, prompt, generation_token = source.token()]() {
            if (generation_token.is_cancelled()) {
                channel->cancel();
                return;
            }
            started->store(true);
            try {
                backend->generate(prompt, *channel, generation_token);
                channel->close();
            } catch (...) {
                channel->fail(std::current_exception());
            }
        });
    } catch (const std::exception& e) {
        // Never reached the backend.
        permit.release();
        result.status = SummaryStatus::kDegraded;
        result.reason = DegradationReason::kBackendFailure;
        result.error = e.what();
        return result;
    }

    CallbackRegistration on_cancel = token.register_callback([channel]() { channel->cancel(); });

    bool produced = false;
    FragmentChannel::Event last;
    try {
        for (;;) {
            FragmentChannel::Event event = channel->pop_until(deadline.at());
            if (event.kind != FragmentChannel::EventKind::kFragment) {
                last = std::move(event);
                break;
            }
            if (event.fragment.empty()) {
                continue;
            }
            produced = true;
            result.text += event.fragment;
            if (on_fragment) {
                on_fragment(event.fragment);
            }
        }
    } catch (...) {
        // The consumer went away mid-stream: stop the producer and let it propagate.
        channel->cancel();
        source.cancel();
        permit.release();
        throw;
    }

    if (last.kind != FragmentChannel::EventKind::kClosed) {
        channel->cancel();
        source.cancel();
    }

    switch (last.kind) {
        case FragmentChannel::EventKind::kClosed:
            permit.succeed();
            return result;
        case FragmentChannel::EventKind::kTimedOut:
            // Never picked up by a worker: nothing is known about the backend.
            if (started->load()) {
                permit.fail();
            } else {
                permit.release();
            }
            result.reason = DegradationReason::kTimeout;
            result.error = GenerationTimeout("no completion within " + std::to_string(options_.budget.count()) +
                                             " ms")
                               .what();
            break;
        case FragmentChannel::EventKind::kFailed:
            if (token.is_cancelled()) {
                permit.release();
                result.reason = DegradationReason::kCancelled;
            } else {
                permit.fail();
                result.reason = DegradationReason::kBackendFailure;
                result.error = describe(last.error);
            }
            break;
        case FragmentChannel::EventKind::kCancelled:
        case FragmentChannel::EventKind::kFragment:
            permit.release();
            result.reason = DegradationReason::kCancelled;
            break;
    }

    result.status = produced ? SummaryStatus::kIncomplete : SummaryStatus::kDegraded;
    return result;
}

SummaryResponse SummaryPipeline::search_with_summary(const SearchRequest& request,
                                                     const FragmentCallback& on_fragment,
                                                     const CancellationToken& token) const {
    const auto start = Clock::now();
    auto& metrics = Metrics::getInstance();

    SearchResponse search = search_->search(request, token);

    SummaryResponse response;
    response.hits = std::move(search.hits);
    response.branches = std::move(search.branches);
    response.search_latency_ms = search.latency_ms;

    if (response.hits.empty()) {
        response.summary = kNoResultsSummary;
        response.status = SummaryStatus::kSkipped;
    } else {
        auto prompt = build_prompt(request.query, response.hits, options_.context_results);

        const auto llm_start = Clock::now();
        Generation generation = generate(prompt, on_fragment, token);
        response.llm_latency_ms = elapsed_ms(llm_start);
        metrics.record_histogram("llm_latency_ms", response.llm_latency_ms);

        response.status = generation.status;
        response.reason = generation.reason;
        if (generation.status == SummaryStatus::kDegraded) {
            response.summary = degraded_summary_marker(generation.reason, generation.error);
        } else {
            response.summary = std::move(generation.text);
        }

        if (generation.status != SummaryStatus::kComplete) {
            HYBRIDRAG_LOG_WARN("summary tenant={} {} ({}) after {:.1f}ms{}{}", request.tenant_id,
                               to_string(generation.status), to_string(generation.reason),
                               response.llm_latency_ms, generation.error.empty() ? "" : ": ",
                               generation.error);
        }
    }

    response.latency_ms = elapsed_ms(start);
    metrics.increment_counter("summary_outcomes", {{"status", to_string(response.status)},
                                                   {"reason", to_string(response.reason)}});
    metrics.record_histogram("summary_latency_ms", response.latency_ms);
    return response;
}

} // namespace hybridrag
