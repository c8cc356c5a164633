#pragma once

#include <gmock/gmock.h>

#include "hybridrag/cancellation.hpp"
#include "hybridrag/collaborators.hpp"
#include "hybridrag/error.hpp"
#include "hybridrag/types.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace hybridrag::test {

using namespace std::chrono_literals;

// Sleeps for `duration`, returning early with CancelledError when the token fires.
inline void sleep_or_cancel(std::chrono::milliseconds duration, const CancellationToken& token) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < until) {
        token.throw_if_cancelled();
        std::this_thread::sleep_for(1ms);
    }
    token.throw_if_cancelled();
}

// Documents ranked in the given order, content "content of <id>".
inline std::vector<RetrievedDocument> make_documents(const std::vector<std::string>& ids) {
    std::vector<RetrievedDocument> docs;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        RetrievedDocument doc;
        doc.document_id = ids[i];
        doc.rank = static_cast<std::uint32_t>(i + 1);
        doc.raw_score = 1.0 - 0.1 * static_cast<double>(i);
        doc.content = "content of " + ids[i];
        docs.push_back(std::move(doc));
    }
    return docs;
}

inline RankedList make_list(const std::vector<std::string>& ids, RetrievalSource source) {
    RankedList list;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        list.push_back(RankedHit{ids[i], static_cast<std::uint32_t>(i + 1), source, std::nullopt});
    }
    return list;
}

class MockDenseRetriever : public DenseRetriever {
public:
    MOCK_METHOD(std::vector<RetrievedDocument>, query_dense,
                (const std::string&, const std::string&, std::size_t, const CancellationToken&), (override));
};

class MockSparseRetriever : public SparseRetriever {
public:
    MOCK_METHOD(std::vector<RetrievedDocument>, query_sparse,
                (const std::string&, const std::string&, std::size_t, const CancellationToken&), (override));
};

/**
 * Streams a fixed list of fragments with a delay before each one. Optionally
 * throws after a number of fragments. Honors the token and the channel's
 * push() result like a real backend.
 */
class ScriptedBackend : public GenerativeBackend {
public:
    std::vector<std::string> fragments;
    std::chrono::milliseconds delay{0};
    std::chrono::milliseconds initial_delay{0};
    // Throw GenerationFailure after this many fragments; negative: never.
    int fail_after = -1;

    std::atomic<int> calls{0};
    std::atomic<bool> saw_cancellation{false};
    std::atomic<bool> finished{false};
    GenerationPrompt last_prompt;

    void generate(const GenerationPrompt& prompt, FragmentChannel& channel,
                  const CancellationToken& token) override {
        ++calls;
        last_prompt = prompt;
        struct Done {
            std::atomic<bool>& flag;
            ~Done() { flag = true; }
        } done{finished};

        try {
            sleep_or_cancel(initial_delay, token);
            for (std::size_t i = 0; i < fragments.size(); ++i) {
                if (fail_after >= 0 && static_cast<int>(i) == fail_after) {
                    throw GenerationFailure("backend exploded");
                }
                if (i > 0) {
                    sleep_or_cancel(delay, token);
                }
                if (!channel.push(fragments[i])) {
                    saw_cancellation = true;
                    return;
                }
            }
            if (fail_after >= 0 && static_cast<std::size_t>(fail_after) >= fragments.size()) {
                throw GenerationFailure("backend exploded");
            }
        } catch (const CancelledError&) {
            saw_cancellation = true;
            throw;
        }
    }
};

} // namespace hybridrag::test
