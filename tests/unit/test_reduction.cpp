#include <gtest/gtest.h>
#include "discovery/reduction.hpp"
#include "test_fixtures.hpp"
#include <cmath>

using namespace nx;

// ==========================================
// Scaling rules
// ==========================================

TEST(ReductionTest, ComponentsScaleWithBatchSize) {
    EXPECT_EQ(scaled_components(5, 5), 2);
    EXPECT_EQ(scaled_components(30, 5), 3);
    EXPECT_EQ(scaled_components(200, 5), 5);
    EXPECT_EQ(scaled_neighbors(40, 15), 4);
    EXPECT_EQ(scaled_neighbors(500, 15), 15);
    EXPECT_EQ(scaled_neighbors(0, 15), 2);
}

// ==========================================
// Normalisation and projection
// ==========================================

TEST(ReductionTest, RowsNormalisedToUnitLength) {
    Eigen::MatrixXd x = l2_normalize_rows({{3.0f, 4.0f}, {0.0f, 0.0f}, {0.0f, 2.0f}});
    ASSERT_EQ(x.rows(), 3);
    EXPECT_NEAR(x(0, 0), 0.6, 1e-9);
    EXPECT_NEAR(x(0, 1), 0.8, 1e-9);
    EXPECT_DOUBLE_EQ(x.row(1).norm(), 0.0);
    EXPECT_NEAR(x.row(2).norm(), 1.0, 1e-9);
}

TEST(ReductionTest, InconsistentDimensionsRejected) {
    EXPECT_THROW(l2_normalize_rows({{1.0f, 0.0f}, {1.0f}}), std::invalid_argument);
}

TEST(ReductionTest, ProjectionIsSeeded) {
    Eigen::MatrixXd x = Eigen::MatrixXd::Identity(4, 300);
    Eigen::MatrixXd a = random_projection(x, 16, 42);
    Eigen::MatrixXd b = random_projection(x, 16, 42);
    Eigen::MatrixXd c = random_projection(x, 16, 7);
    EXPECT_EQ(a.rows(), 4);
    EXPECT_EQ(a.cols(), 16);
    EXPECT_TRUE(a.isApprox(b));
    EXPECT_FALSE(a.isApprox(c));
}

// ==========================================
// PCA
// ==========================================

TEST(ReductionTest, PcaCapturesDominantAxis) {
    Eigen::MatrixXd x(4, 3);
    x << -2.0, 0.0, 0.1,
         -1.0, 0.0, -0.1,
          1.0, 0.0, -0.1,
          2.0, 0.0, 0.1;
    double variance = 0.0;
    Eigen::MatrixXd scores = pca_scores(x, 2, variance);

    EXPECT_EQ(scores.cols(), 2);
    EXPECT_NEAR(variance, (4.0 + 1.0 + 1.0 + 4.0 + 0.04) / 3.0, 1e-9);
    // First component follows the x axis; largest magnitude entry is positive
    EXPECT_NEAR(std::abs(scores(0, 0)), 2.0, 1e-6);
    EXPECT_NEAR(std::abs(scores(3, 0)), 2.0, 1e-6);
    EXPECT_GT(scores.col(0).maxCoeff(), 0.0);
    Eigen::Index arg = 0;
    scores.col(0).cwiseAbs().maxCoeff(&arg);
    EXPECT_GT(scores(arg, 0), 0.0);
}

TEST(ReductionTest, IdenticalEmbeddingsAreDegenerate) {
    std::vector<std::vector<float>> same(6, std::vector<float>{0.2f, 0.5f, 0.1f});
    ReductionResult r = reduce_embeddings(same, ReductionConfig());
    EXPECT_TRUE(r.degenerate);
    EXPECT_LT(r.total_variance, 1e-10);
}

TEST(ReductionTest, ClusteredBatchReducedToScaledComponents) {
    auto docs = testing_fixtures::clustered_documents(3, 10, 16);
    std::vector<std::vector<float>> embeddings;
    for (const auto& d : docs) embeddings.push_back(d.embedding);

    ReductionResult r = reduce_embeddings(embeddings, ReductionConfig());
    EXPECT_FALSE(r.degenerate);
    EXPECT_EQ(r.components, 3);
    EXPECT_EQ(r.points.rows(), 30);
    EXPECT_EQ(r.points.cols(), 3);
    EXPECT_EQ(r.normalized.cols(), 16);
    EXPECT_EQ(r.neighbors, 3);
}

TEST(ReductionTest, WideEmbeddingsProjectedFirst) {
    auto docs = testing_fixtures::clustered_documents(2, 10, 512);
    std::vector<std::vector<float>> embeddings;
    for (const auto& d : docs) embeddings.push_back(d.embedding);

    ReductionConfig config;
    config.projection_threshold = 256;
    config.projection_dims = 32;
    ReductionResult r = reduce_embeddings(embeddings, config);
    EXPECT_EQ(r.normalized.cols(), 512);
    EXPECT_EQ(r.points.cols(), 2);
}

TEST(ReductionTest, TinyBatchKeepsNormalisedPoints) {
    ReductionResult r = reduce_embeddings({{1.0f, 1.0f}, {2.0f, 0.0f}}, ReductionConfig());
    EXPECT_FALSE(r.degenerate);
    EXPECT_EQ(r.points.rows(), 2);
    EXPECT_EQ(r.components, 2);
    EXPECT_NEAR(r.points.row(0).norm(), 1.0, 1e-9);
}
