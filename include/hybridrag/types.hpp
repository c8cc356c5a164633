#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hybridrag {

using Metadata = std::map<std::string, std::string>;

enum class RetrievalSource {
    kDense,
    kSparse,
};

const char* to_string(RetrievalSource source) noexcept;

// One entry of a ranked list produced by a single retrieval call.
struct RankedHit {
    std::string document_id;
    std::uint32_t rank = 0;  // 1-based, unique within its list
    RetrievalSource source = RetrievalSource::kDense;
    std::optional<double> raw_score;
};

using RankedList = std::vector<RankedHit>;

// What a retrieval collaborator hands back: ranking plus the stored payload.
struct RetrievedDocument {
    std::string document_id;
    std::uint32_t rank = 0;
    std::optional<double> raw_score;
    std::string content;
    Metadata metadata;
};

struct FusedResult {
    std::string document_id;
    double fused_score = 0.0;
    // Contributing sources with the rank each one gave the document.
    std::map<RetrievalSource, std::uint32_t> source_ranks;

    std::set<RetrievalSource> sources() const;
    bool contributed_by(RetrievalSource source) const {
        return source_ranks.count(source) != 0;
    }
};

struct SearchRequest {
    std::string tenant_id;
    std::string query;
    std::size_t top_k = 5;
};

struct SearchHit {
    std::string document_id;
    double score = 0.0;
    std::set<RetrievalSource> sources;
    std::string content;
    Metadata metadata;
};

enum class BranchStatus {
    kOk,
    kTimedOut,
    kCircuitOpen,
    kFailed,
    kCancelled,
};

const char* to_string(BranchStatus status) noexcept;

struct BranchReport {
    RetrievalSource source = RetrievalSource::kDense;
    BranchStatus status = BranchStatus::kOk;
    std::size_t hit_count = 0;
    std::string detail;
};

struct SearchResponse {
    std::vector<SearchHit> hits;
    double latency_ms = 0.0;
    std::vector<BranchReport> branches;

    bool degraded() const;
};

enum class SummaryStatus {
    kComplete,
    kIncomplete,  // stream interrupted after output was produced
    kDegraded,    // no summary; search results only
    kSkipped,     // nothing to summarize
};

enum class DegradationReason {
    kNone,
    kCircuitOpen,
    kTimeout,
    kBackendFailure,
    kCancelled,
};

const char* to_string(SummaryStatus status) noexcept;
const char* to_string(DegradationReason reason) noexcept;

struct SummaryResponse {
    std::vector<SearchHit> hits;
    std::vector<BranchReport> branches;
    std::string summary;
    SummaryStatus status = SummaryStatus::kComplete;
    DegradationReason reason = DegradationReason::kNone;
    double latency_ms = 0.0;
    double search_latency_ms = 0.0;
    double llm_latency_ms = 0.0;

    bool degraded() const { return status == SummaryStatus::kDegraded; }
};

// Input for ingestion through the vector-store adapter.
struct DocumentInput {
    std::string tenant_id;
    std::string document_id;
    std::string content;
    Metadata metadata;
};

} // namespace hybridrag
