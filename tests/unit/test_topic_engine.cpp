#include <gtest/gtest.h>
#include "discovery/topic_engine.hpp"
#include "util/errors.hpp"
#include "test_fixtures.hpp"
#include <set>

using namespace nx;
using namespace nx::testing_fixtures;

class TopicEngineTest : public ::testing::Test {
protected:
    DiscoveryConfig config;

    DiscoveryRequest request_for(std::vector<DiscoveryDocument> docs, int min_cluster_size) {
        DiscoveryRequest r;
        r.query = "machine learning";
        r.documents = std::move(docs);
        r.min_cluster_size = min_cluster_size;
        return r;
    }
};

// ==========================================
// Clustering behaviour
// ==========================================

TEST_F(TopicEngineTest, SeparatedGroupsBecomePureTopics) {
    TopicDiscoveryEngine engine(config);
    DiscoveryRequest request = request_for(clustered_documents(3, 10), 4);
    DiscoveryResult result = engine.discover(request);

    EXPECT_EQ(result.total_articles_processed, 30);
    ASSERT_GE(result.topics.size(), 3u);

    std::set<std::string> ids;
    for (const auto& topic : result.topics) {
        EXPECT_TRUE(ids.insert(topic.id).second);
        EXPECT_GE(topic.cluster_size, 4);
        EXPECT_GE(topic.relevance, 0);
        EXPECT_LE(topic.relevance, 100);
        EXPECT_FALSE(topic.title.empty());
        EXPECT_LE(topic.keywords.size(), 5u);
        EXPECT_EQ(topic.centroid.size(), 16u);

        ASSERT_FALSE(topic.members.empty());
        int group = group_of(request.documents[topic.members.front()].id);
        for (size_t m : topic.members) {
            EXPECT_EQ(group_of(request.documents[m].id), group);
        }
    }
    EXPECT_EQ(result.topics.front().relevance, 100);
}

TEST_F(TopicEngineTest, TitlesComeFromSharedPhrases) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(3, 10), 4));

    bool found = false;
    for (const auto& topic : result.topics) {
        if (topic.title.find("Graph Neural Networks") != std::string::npos) found = true;
    }
    EXPECT_TRUE(found);
}

TEST_F(TopicEngineTest, TopicsRankedByRelevance) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(3, 10), 3));
    for (size_t i = 1; i < result.topics.size(); ++i) {
        const auto& prev = result.topics[i - 1];
        const auto& cur = result.topics[i];
        EXPECT_TRUE(prev.relevance > cur.relevance ||
                    (prev.relevance == cur.relevance && prev.cluster_size >= cur.cluster_size));
    }
}

TEST_F(TopicEngineTest, TargetCountMergesClusters) {
    TopicDiscoveryEngine engine(config);
    DiscoveryRequest request = request_for(clustered_documents(3, 10), 3);
    request.target_topic_count = 1;
    DiscoveryResult result = engine.discover(request);

    ASSERT_EQ(result.topics.size(), 1u);
    EXPECT_EQ(result.topics[0].relevance, 100);
    EXPECT_GE(result.topics[0].cluster_size, 20);
}

TEST_F(TopicEngineTest, MembersCappedButClusterSizeKept) {
    config.max_articles_per_topic = 4;
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(2, 10), 3));

    ASSERT_FALSE(result.topics.empty());
    for (const auto& topic : result.topics) {
        EXPECT_LE(topic.members.size(), 4u);
        EXPECT_GT(topic.cluster_size, 4);
    }
}

TEST_F(TopicEngineTest, MemberCapNeverBelowMinClusterSize) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(2, 100), 80));

    ASSERT_EQ(result.topics.size(), 2u);
    for (const auto& topic : result.topics) {
        EXPECT_GE(topic.members.size(), 80u);
        EXPECT_LE(topic.members.size(), static_cast<size_t>(topic.cluster_size));
    }
}

TEST_F(TopicEngineTest, DeterministicApartFromIds) {
    TopicDiscoveryEngine engine(config);
    auto docs = clustered_documents(3, 8);
    DiscoveryResult a = engine.discover(request_for(docs, 3));
    DiscoveryResult b = engine.discover(request_for(docs, 3));

    ASSERT_EQ(a.topics.size(), b.topics.size());
    for (size_t i = 0; i < a.topics.size(); ++i) {
        EXPECT_EQ(a.topics[i].title, b.topics[i].title);
        EXPECT_EQ(a.topics[i].relevance, b.topics[i].relevance);
        EXPECT_EQ(a.topics[i].members, b.topics[i].members);
        EXPECT_NE(a.topics[i].id, b.topics[i].id);
    }
}

// ==========================================
// Sub-clustering
// ==========================================

namespace {

// One 40-point cluster made of groups 0 and 1, plus three 6-point clusters
// from groups 2, 3 and 4.
struct OversizedLayout {
    std::vector<std::vector<float>> embeddings;
    std::vector<TopicDiscoveryEngine::Cluster> clusters;
    std::vector<std::string> ids;
};

OversizedLayout oversized_layout() {
    OversizedLayout layout;
    auto docs = clustered_documents(5, 20);
    for (const auto& doc : docs) {
        layout.embeddings.push_back(doc.embedding);
        layout.ids.push_back(doc.id);
    }
    TopicDiscoveryEngine::Cluster big;
    for (size_t i = 0; i < 40; ++i) big.push_back(i);
    layout.clusters.push_back(big);
    for (size_t g = 2; g < 5; ++g) {
        TopicDiscoveryEngine::Cluster small;
        for (size_t i = 0; i < 6; ++i) small.push_back(g * 20 + i);
        layout.clusters.push_back(small);
    }
    return layout;
}

} // namespace

TEST_F(TopicEngineTest, OversizedClusterSplitsIntoPureSubclusters) {
    config.max_subcluster_depth = 1;
    TopicDiscoveryEngine engine(config);
    OversizedLayout layout = oversized_layout();

    engine.split_oversized(layout.clusters, layout.embeddings, 4, 2, std::nullopt);

    ASSERT_GE(layout.clusters.size(), 5u);
    std::set<size_t> seen;
    size_t from_big = 0;
    for (const auto& cluster : layout.clusters) {
        EXPECT_GE(cluster.size(), 4u);
        std::set<int> groups;
        for (size_t i : cluster) {
            groups.insert(group_of(layout.ids[i]));
            EXPECT_TRUE(seen.insert(i).second) << "row " << i << " assigned twice";
        }
        EXPECT_EQ(groups.size(), 1u);
        if (cluster.front() < 40) ++from_big;
    }
    EXPECT_GE(from_big, 2u);
    EXPECT_EQ(seen.size(), 58u);
}

TEST_F(TopicEngineTest, SplitBlockedWhenTargetReached) {
    TopicDiscoveryEngine engine(config);
    OversizedLayout layout = oversized_layout();

    engine.split_oversized(layout.clusters, layout.embeddings, 4, 2, 4);

    ASSERT_EQ(layout.clusters.size(), 4u);
    EXPECT_EQ(layout.clusters.front().size(), 40u);
}

TEST_F(TopicEngineTest, SplitNeedsTwiceMinClusterSize) {
    TopicDiscoveryEngine engine(config);
    OversizedLayout layout = oversized_layout();

    // 40 rows cannot hold two sub-clusters of 21
    engine.split_oversized(layout.clusters, layout.embeddings, 21, 2, std::nullopt);

    ASSERT_EQ(layout.clusters.size(), 4u);
    EXPECT_EQ(layout.clusters.front().size(), 40u);
}

// ==========================================
// Edge cases
// ==========================================

TEST_F(TopicEngineTest, FewerDocumentsThanMinClusterSize) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(1, 3), 5));
    EXPECT_TRUE(result.topics.empty());
    EXPECT_EQ(result.total_articles_processed, 3);
}

TEST_F(TopicEngineTest, DocumentsWithoutEmbeddingsSkipped) {
    auto docs = clustered_documents(1, 6);
    docs[0].embedding.clear();
    docs[3].embedding.clear();
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(docs, 2));

    EXPECT_EQ(result.total_articles_processed, 4);
    for (const auto& topic : result.topics) {
        for (size_t m : topic.members) {
            EXPECT_NE(m, 0u);
            EXPECT_NE(m, 3u);
        }
    }
}

TEST_F(TopicEngineTest, IdenticalEmbeddingsFormOneTopic) {
    auto docs = clustered_documents(1, 6, 8);
    for (auto& d : docs) d.embedding = docs.front().embedding;
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(docs, 2));

    ASSERT_EQ(result.topics.size(), 1u);
    EXPECT_EQ(result.topics[0].cluster_size, 6);
    EXPECT_EQ(result.topics[0].relevance, 100);
}

TEST_F(TopicEngineTest, TwoDocumentsFormOneTopic) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for(clustered_documents(2, 1), 1));
    ASSERT_EQ(result.topics.size(), 1u);
    EXPECT_EQ(result.topics[0].cluster_size, 2);
}

TEST_F(TopicEngineTest, EmptyBatchHasNoTopics) {
    TopicDiscoveryEngine engine(config);
    DiscoveryResult result = engine.discover(request_for({}, 2));
    EXPECT_TRUE(result.topics.empty());
    EXPECT_EQ(result.total_articles_processed, 0);
}

TEST_F(TopicEngineTest, InvalidInputRejected) {
    TopicDiscoveryEngine engine(config);
    auto docs = clustered_documents(1, 4);
    docs[2].embedding.pop_back();
    EXPECT_THROW(engine.discover(request_for(docs, 2)), DiscoveryFailure);

    EXPECT_THROW(engine.discover(request_for(clustered_documents(1, 4), 0)), DiscoveryFailure);

    DiscoveryRequest zero_target = request_for(clustered_documents(1, 4), 2);
    zero_target.target_topic_count = 0;
    EXPECT_THROW(engine.discover(zero_target), DiscoveryFailure);
}

// ==========================================
// Scoring helpers
// ==========================================

TEST(TopicScoringTest, RawRelevanceBlendsSizeAndConfidence) {
    EXPECT_DOUBLE_EQ(TopicDiscoveryEngine::raw_relevance(10, 10, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(TopicDiscoveryEngine::raw_relevance(5, 10, 0.0), 0.3);
    EXPECT_DOUBLE_EQ(TopicDiscoveryEngine::raw_relevance(5, 10, 2.0), 0.5);
    EXPECT_DOUBLE_EQ(TopicDiscoveryEngine::raw_relevance(5, 0, 1.0), 0.0);
}

TEST(TopicScoringTest, RankBreaksTiesBySizeThenTitle) {
    std::vector<DiscoveredTopic> topics(4);
    topics[0].title = "Beta";  topics[0].relevance = 80; topics[0].cluster_size = 5;
    topics[1].title = "Alpha"; topics[1].relevance = 80; topics[1].cluster_size = 5;
    topics[2].title = "Gamma"; topics[2].relevance = 80; topics[2].cluster_size = 9;
    topics[3].title = "Delta"; topics[3].relevance = 100; topics[3].cluster_size = 2;

    TopicDiscoveryEngine::rank_topics(topics);
    EXPECT_EQ(topics[0].title, "Delta");
    EXPECT_EQ(topics[1].title, "Gamma");
    EXPECT_EQ(topics[2].title, "Alpha");
    EXPECT_EQ(topics[3].title, "Beta");
}
