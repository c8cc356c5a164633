#include <gtest/gtest.h>

#include "hybridrag/error.hpp"
#include "hybridrag/rank_fuser.hpp"
#include "test_fakes.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace hybridrag;
using hybridrag::test::make_list;

namespace {

std::vector<std::string> ids_of(const std::vector<FusedResult>& fused) {
    std::vector<std::string> ids;
    for (const auto& r : fused) {
        ids.push_back(r.document_id);
    }
    return ids;
}

} // namespace

TEST(RankFuserTest, WorkedExampleOrdersBADC) {
    RankFuser fuser;
    auto fused = fuser.fuse({make_list({"A", "B", "C"}, RetrievalSource::kDense),
                             make_list({"B", "D"}, RetrievalSource::kSparse)});

    ASSERT_EQ(fused.size(), 4u);
    EXPECT_EQ(ids_of(fused), (std::vector<std::string>{"B", "A", "D", "C"}));

    EXPECT_NEAR(fused[0].fused_score, 1.0 / 61 + 1.0 / 61, 1e-12);
    EXPECT_NEAR(fused[1].fused_score, 1.0 / 61, 1e-12);
    EXPECT_NEAR(fused[2].fused_score, 1.0 / 62, 1e-12);
    EXPECT_NEAR(fused[3].fused_score, 1.0 / 63, 1e-12);

    EXPECT_TRUE(fused[0].contributed_by(RetrievalSource::kDense));
    EXPECT_TRUE(fused[0].contributed_by(RetrievalSource::kSparse));
    EXPECT_EQ(fused[2].sources(), std::set<RetrievalSource>{RetrievalSource::kSparse});
}

TEST(RankFuserTest, EmptyInputGivesEmptyOutput) {
    RankFuser fuser;
    EXPECT_TRUE(fuser.fuse({}).empty());
    EXPECT_TRUE(fuser.fuse({RankedList{}, RankedList{}}).empty());
}

TEST(RankFuserTest, SingleSourcePreservesOrder) {
    RankFuser fuser;
    auto dense = make_list({"z", "a", "m", "b"}, RetrievalSource::kDense);
    auto fused = fuser.fuse({dense, RankedList{}});

    EXPECT_EQ(ids_of(fused), (std::vector<std::string>{"z", "a", "m", "b"}));
    for (std::size_t i = 0; i < fused.size(); ++i) {
        EXPECT_DOUBLE_EQ(fused[i].fused_score, 1.0 / (60.0 + static_cast<double>(i + 1)));
    }
}

TEST(RankFuserTest, OutputIndependentOfListOrder) {
    RankFuser fuser(10.0);
    auto dense = make_list({"d1", "d2", "shared", "d3"}, RetrievalSource::kDense);
    auto sparse = make_list({"shared", "s1", "d3", "s2"}, RetrievalSource::kSparse);

    auto forward = fuser.fuse({dense, sparse});
    auto reversed = fuser.fuse({sparse, dense});
    auto again = fuser.fuse({dense, sparse});

    ASSERT_EQ(forward.size(), reversed.size());
    for (std::size_t i = 0; i < forward.size(); ++i) {
        EXPECT_EQ(forward[i].document_id, reversed[i].document_id);
        EXPECT_EQ(forward[i].fused_score, reversed[i].fused_score);
        EXPECT_EQ(forward[i].document_id, again[i].document_id);
    }
}

TEST(RankFuserTest, TiesPreferMoreSourcesThenDenseRankThenId) {
    RankFuser fuser;
    auto dense = make_list({"p", "q"}, RetrievalSource::kDense);
    auto sparse = make_list({"q", "p"}, RetrievalSource::kSparse);
    auto fused = fuser.fuse({dense, sparse});

    // p and q both score 1/61 + 1/62; p has the better dense rank.
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].fused_score, fused[1].fused_score);
    EXPECT_EQ(fused[0].document_id, "p");

    // Same score, dense presence wins over sparse-only.
    auto only_sparse = fuser.fuse({make_list({"s"}, RetrievalSource::kSparse),
                                   make_list({"d"}, RetrievalSource::kDense)});
    EXPECT_EQ(ids_of(only_sparse), (std::vector<std::string>{"d", "s"}));

    // Same score and sources, no dense rank: lexicographic.
    auto sparse_only = fuser.fuse({make_list({"beta"}, RetrievalSource::kSparse),
                                   make_list({"alpha"}, RetrievalSource::kSparse)});
    EXPECT_EQ(ids_of(sparse_only), (std::vector<std::string>{"alpha", "beta"}));
}

TEST(RankFuserTest, FusedBeforeRanksMoreSourcesFirstOnEqualScore) {
    FusedResult one;
    one.document_id = "a";
    one.fused_score = 0.5;
    one.source_ranks = {{RetrievalSource::kDense, 3}};

    FusedResult two;
    two.document_id = "b";
    two.fused_score = 0.5;
    two.source_ranks = {{RetrievalSource::kDense, 9}, {RetrievalSource::kSparse, 9}};

    EXPECT_TRUE(fused_before(two, one));
    EXPECT_FALSE(fused_before(one, two));
}

TEST(RankFuserTest, DuplicateWithinListCountsOnceAtBestRank) {
    RankFuser fuser;
    RankedList dense = {
        {"a", 1, RetrievalSource::kDense, std::nullopt},
        {"b", 2, RetrievalSource::kDense, std::nullopt},
        {"a", 3, RetrievalSource::kDense, std::nullopt},
    };
    auto fused = fuser.fuse({dense});

    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].document_id, "a");
    EXPECT_DOUBLE_EQ(fused[0].fused_score, 1.0 / 61);
    EXPECT_EQ(fused[0].source_ranks.at(RetrievalSource::kDense), 1u);
}

TEST(RankFuserTest, LargerKFlattensRankAdvantage) {
    auto dense = make_list({"top", "second"}, RetrievalSource::kDense);
    auto small = RankFuser(1.0).fuse({dense});
    auto large = RankFuser(1000.0).fuse({dense});

    const double small_ratio = small[0].fused_score / small[1].fused_score;
    const double large_ratio = large[0].fused_score / large[1].fused_score;
    EXPECT_GT(small_ratio, large_ratio);
    EXPECT_NEAR(large_ratio, 1.0, 0.01);
}

TEST(RankFuserTest, RejectsInvalidInput) {
    EXPECT_THROW(RankFuser(0.0), InvalidArgumentError);
    EXPECT_THROW(RankFuser(-5.0), InvalidArgumentError);

    RankFuser fuser;
    RankedList zero_rank = {{"a", 0, RetrievalSource::kDense, std::nullopt}};
    EXPECT_THROW(fuser.fuse({zero_rank}), InvalidArgumentError);
}
