#include <gtest/gtest.h>
#include "store/sqlite_analysis_store.hpp"
#include "util/errors.hpp"

using namespace nx;

class AnalysisStoreTest : public ::testing::Test {
protected:
    std::unique_ptr<SqliteAnalysisStore> store;

    void SetUp() override {
        store = std::make_unique<SqliteAnalysisStore>(":memory:");
    }

    Analysis stub(const std::string& id, const std::string& query, int64_t created_at_ms = 1000) {
        Analysis a;
        a.id = id;
        a.query = query;
        a.created_at_ms = created_at_ms;
        return a;
    }

    Article article(const std::string& external_id, std::vector<float> embedding = {}) {
        Article a;
        a.external_id = external_id;
        a.title = "Title " + external_id;
        a.link = "https://example.org/" + external_id;
        a.snippet = "Snippet " + external_id;
        a.embedding = std::move(embedding);
        return a;
    }

    Topic topic(const std::string& id, const std::string& title, int relevance,
                std::vector<float> centroid, std::vector<Article> articles) {
        Topic t;
        t.id = id;
        t.title = title;
        t.description = title + " description";
        t.relevance = relevance;
        t.embedding = std::move(centroid);
        t.articles = std::move(articles);
        t.article_count = static_cast<int>(t.articles.size());
        return t;
    }

    void walk_to_discovering(const std::string& id) {
        ASSERT_TRUE(store->update_status(id, AnalysisStatus::CLASSIFYING));
        ASSERT_TRUE(store->update_classification(id, AnalysisType::RESEARCH, "cat:cs.CL"));
        ASSERT_TRUE(store->update_status(id, AnalysisStatus::FETCHING_ARTICLES));
        ASSERT_TRUE(store->update_status(id, AnalysisStatus::EMBEDDING_ARTICLES));
        ASSERT_TRUE(store->update_status(id, AnalysisStatus::DISCOVERING_TOPICS));
    }
};

// ==========================================
// Analysis lifecycle
// ==========================================

TEST_F(AnalysisStoreTest, CreateIsIdempotent) {
    store->create_analysis(stub("a1", "first"));
    store->create_analysis(stub("a1", "second"));

    EXPECT_EQ(store->count_analyses(), 1);
    auto a = store->get_analysis("a1");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->query, "first");
    EXPECT_EQ(a->status, AnalysisStatus::PENDING);
    EXPECT_FALSE(a->type.has_value());
    EXPECT_TRUE(a->topics.empty());
}

TEST_F(AnalysisStoreTest, UnknownAnalysisIsAbsent) {
    EXPECT_FALSE(store->get_analysis("missing").has_value());
    EXPECT_FALSE(store->update_status("missing", AnalysisStatus::CLASSIFYING));
    EXPECT_FALSE(store->mark_failed("missing", "fetch", "boom"));
    EXPECT_FALSE(store->delete_analysis("missing"));
}

TEST_F(AnalysisStoreTest, StatusOnlyMovesForward) {
    store->create_analysis(stub("a1", "q"));
    EXPECT_TRUE(store->update_status("a1", AnalysisStatus::CLASSIFYING));
    EXPECT_TRUE(store->update_status("a1", AnalysisStatus::FETCHING_ARTICLES));

    EXPECT_FALSE(store->update_status("a1", AnalysisStatus::CLASSIFYING));
    EXPECT_FALSE(store->update_status("a1", AnalysisStatus::FETCHING_ARTICLES));
    EXPECT_EQ(store->get_analysis("a1")->status, AnalysisStatus::FETCHING_ARTICLES);
}

TEST_F(AnalysisStoreTest, FailedIsTerminal) {
    store->create_analysis(stub("a1", "q"));
    ASSERT_TRUE(store->update_status("a1", AnalysisStatus::CLASSIFYING));
    EXPECT_TRUE(store->mark_failed("a1", "classification", "HTTP 503"));

    auto a = store->get_analysis("a1");
    EXPECT_EQ(a->status, AnalysisStatus::FAILED);
    EXPECT_EQ(a->failure_stage, "classification");
    EXPECT_EQ(a->failure_reason, "HTTP 503");

    EXPECT_FALSE(store->update_status("a1", AnalysisStatus::FETCHING_ARTICLES));
    EXPECT_FALSE(store->update_classification("a1", AnalysisType::COMMUNITY, "rust"));
    EXPECT_FALSE(store->mark_failed("a1", "fetch", "again"));
    EXPECT_FALSE(store->commit_results("a1", {}, 0));
    EXPECT_EQ(store->get_analysis("a1")->failure_stage, "classification");
}

TEST_F(AnalysisStoreTest, ClassificationRecorded) {
    store->create_analysis(stub("a1", "q"));
    EXPECT_TRUE(store->update_classification("a1", AnalysisType::COMMUNITY, "LocalLLaMA"));

    auto a = store->get_analysis("a1");
    ASSERT_TRUE(a->type.has_value());
    EXPECT_EQ(*a->type, AnalysisType::COMMUNITY);
    EXPECT_EQ(a->feed_url, "LocalLLaMA");
}

// ==========================================
// Results
// ==========================================

TEST_F(AnalysisStoreTest, CommitPersistsTopicsInOrder) {
    store->create_analysis(stub("a1", "q"));
    walk_to_discovering("a1");

    std::vector<Topic> topics = {
        topic("t1", "Graph Neural Networks", 100, {1.0f, 0.0f}, {article("x1"), article("x2"), article("x3")}),
        topic("t2", "Protein Folding", 60, {0.0f, 1.0f}, {article("x4"), article("x5")})
    };
    EXPECT_TRUE(store->commit_results("a1", topics, 5));

    auto a = store->get_analysis("a1");
    EXPECT_EQ(a->status, AnalysisStatus::COMPLETED);
    EXPECT_EQ(a->total_articles_processed, 5);
    ASSERT_EQ(a->topics.size(), 2u);
    EXPECT_EQ(a->topics[0].title, "Graph Neural Networks");
    EXPECT_EQ(a->topics[0].relevance, 100);
    EXPECT_EQ(a->topics[0].article_count, 3);
    ASSERT_EQ(a->topics[0].articles.size(), 3u);
    EXPECT_EQ(a->topics[0].articles[0].external_id, "x1");
    EXPECT_FALSE(a->topics[0].articles[0].id.empty());
    EXPECT_EQ(a->topics[1].article_count, 2);
    EXPECT_EQ(store->count_articles(), 5);
}

TEST_F(AnalysisStoreTest, SecondCommitIsRejected) {
    store->create_analysis(stub("a1", "q"));
    walk_to_discovering("a1");
    ASSERT_TRUE(store->commit_results("a1", {topic("t1", "One", 100, {}, {article("x1")})}, 1));

    EXPECT_FALSE(store->commit_results("a1", {topic("t2", "Two", 50, {}, {article("x2")})}, 1));
    auto a = store->get_analysis("a1");
    ASSERT_EQ(a->topics.size(), 1u);
    EXPECT_EQ(a->topics[0].title, "One");
    EXPECT_EQ(store->count_articles(), 1);
}

TEST_F(AnalysisStoreTest, EmptyCommitCompletesWithZeroTopics) {
    store->create_analysis(stub("a1", "q"));
    ASSERT_TRUE(store->update_status("a1", AnalysisStatus::CLASSIFYING));
    ASSERT_TRUE(store->update_status("a1", AnalysisStatus::FETCHING_ARTICLES));
    EXPECT_TRUE(store->commit_results("a1", {}, 0));

    auto a = store->get_analysis("a1");
    EXPECT_EQ(a->status, AnalysisStatus::COMPLETED);
    EXPECT_TRUE(a->topics.empty());
    EXPECT_EQ(a->total_articles_processed, 0);
}

TEST_F(AnalysisStoreTest, ArticlesSharedAcrossAnalyses) {
    store->create_analysis(stub("a1", "q1"));
    store->create_analysis(stub("a2", "q2", 2000));
    walk_to_discovering("a1");
    walk_to_discovering("a2");

    ASSERT_TRUE(store->commit_results("a1", {topic("t1", "A", 100, {}, {article("shared"), article("only1")})}, 2));
    ASSERT_TRUE(store->commit_results("a2", {topic("t2", "B", 100, {}, {article("shared"), article("only2")})}, 2));
    EXPECT_EQ(store->count_articles(), 3);

    auto first = store->get_analysis("a1")->topics[0].articles[0];
    auto second = store->get_analysis("a2")->topics[0].articles[0];
    EXPECT_EQ(first.external_id, "shared");
    EXPECT_EQ(first.id, second.id);
}

TEST_F(AnalysisStoreTest, UpsertArticleReturnsExistingId) {
    std::string id = store->upsert_article(article("x1"));
    Article changed = article("x1");
    changed.title = "Different";
    EXPECT_EQ(store->upsert_article(changed), id);
    EXPECT_EQ(store->count_articles(), 1);
}

TEST_F(AnalysisStoreTest, DeleteCascadesButKeepsArticles) {
    store->create_analysis(stub("a1", "q"));
    walk_to_discovering("a1");
    ASSERT_TRUE(store->commit_results("a1", {topic("t1", "A", 100, {1.0f, 0.0f}, {article("x1"), article("x2")})}, 2));

    EXPECT_TRUE(store->delete_analysis("a1"));
    EXPECT_FALSE(store->get_analysis("a1").has_value());
    EXPECT_EQ(store->count_analyses(), 0);
    EXPECT_EQ(store->count_articles(), 2);
    EXPECT_THROW(store->find_similar_topics("t1", 5), NotFound);
    EXPECT_FALSE(store->delete_analysis("a1"));
}

TEST_F(AnalysisStoreTest, CommitAfterDeleteIsDiscarded) {
    store->create_analysis(stub("a1", "q"));
    walk_to_discovering("a1");
    ASSERT_TRUE(store->delete_analysis("a1"));

    EXPECT_FALSE(store->commit_results("a1", {topic("t1", "A", 100, {}, {article("x1")})}, 1));
    EXPECT_EQ(store->count_articles(), 0);
    EXPECT_FALSE(store->update_status("a1", AnalysisStatus::COMPLETED));
}

// ==========================================
// Listing and similarity
// ==========================================

TEST_F(AnalysisStoreTest, ListIsNewestFirstAndPaged) {
    store->create_analysis(stub("old", "q1", 1000));
    store->create_analysis(stub("mid", "q2", 2000));
    store->create_analysis(stub("new", "q3", 3000));

    auto page = store->list_analyses(2, 0);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id, "new");
    EXPECT_EQ(page[1].id, "mid");

    auto rest = store->list_analyses(2, 2);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].id, "old");
    EXPECT_EQ(store->count_analyses(), 3);
}

TEST_F(AnalysisStoreTest, SimilarTopicsRankedAcrossOtherAnalyses) {
    store->create_analysis(stub("a1", "q1"));
    store->create_analysis(stub("a2", "q2", 2000));
    walk_to_discovering("a1");
    walk_to_discovering("a2");

    ASSERT_TRUE(store->commit_results("a1", {
        topic("base", "Base", 100, {1.0f, 0.0f, 0.0f}, {article("x1")}),
        topic("sibling", "Sibling", 90, {1.0f, 0.0f, 0.0f}, {article("x2")})
    }, 2));
    ASSERT_TRUE(store->commit_results("a2", {
        topic("close", "Close", 100, {0.9f, 0.1f, 0.0f}, {article("x3")}),
        topic("far", "Far", 80, {0.0f, 0.0f, 1.0f}, {article("x4")}),
        topic("none", "No centroid", 50, {}, {article("x5")})
    }, 3));

    auto similar = store->find_similar_topics("base", 5);
    ASSERT_EQ(similar.size(), 2u);
    EXPECT_EQ(similar[0].topic.id, "close");
    EXPECT_EQ(similar[0].topic.analysis_id, "a2");
    EXPECT_GT(similar[0].similarity, 0.9);
    EXPECT_EQ(similar[1].topic.id, "far");
    EXPECT_NEAR(similar[1].similarity, 0.0, 1e-6);

    EXPECT_EQ(store->find_similar_topics("base", 1).size(), 1u);
    EXPECT_TRUE(store->find_similar_topics("none", 5).empty());
    EXPECT_THROW(store->find_similar_topics("missing", 5), NotFound);
}
