#include "hybridrag/types.hpp"

#include <algorithm>

namespace hybridrag {

const char* to_string(RetrievalSource source) noexcept {
    switch (source) {
        case RetrievalSource::kDense: return "dense";
        case RetrievalSource::kSparse: return "sparse";
    }
    return "unknown";
}

const char* to_string(BranchStatus status) noexcept {
    switch (status) {
        case BranchStatus::kOk: return "ok";
        case BranchStatus::kTimedOut: return "timed_out";
        case BranchStatus::kCircuitOpen: return "circuit_open";
        case BranchStatus::kFailed: return "failed";
        case BranchStatus::kCancelled: return "cancelled";
    }
    return "unknown";
}

const char* to_string(SummaryStatus status) noexcept {
    switch (status) {
        case SummaryStatus::kComplete: return "complete";
        case SummaryStatus::kIncomplete: return "incomplete";
        case SummaryStatus::kDegraded: return "degraded";
        case SummaryStatus::kSkipped: return "skipped";
    }
    return "unknown";
}

const char* to_string(DegradationReason reason) noexcept {
    switch (reason) {
        case DegradationReason::kNone: return "none";
        case DegradationReason::kCircuitOpen: return "circuit_open";
        case DegradationReason::kTimeout: return "timeout";
        case DegradationReason::kBackendFailure: return "backend_failure";
        case DegradationReason::kCancelled: return "cancelled";
    }
    return "unknown";
}

std::set<RetrievalSource> FusedResult::sources() const {
    std::set<RetrievalSource> out;
    for (const auto& entry : source_ranks) {
        out.insert(entry.first);
    }
    return out;
}

bool SearchResponse::degraded() const {
    return std::any_of(branches.begin(), branches.end(),
                       [](const BranchReport& b) { return b.status != BranchStatus::kOk; });
}

} // namespace hybridrag
