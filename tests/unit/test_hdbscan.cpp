#include <gtest/gtest.h>
#include "discovery/hdbscan.hpp"

using namespace nx;

namespace {

Eigen::MatrixXd two_blobs(bool with_outlier) {
    Eigen::MatrixXd p(with_outlier ? 11 : 10, 2);
    p << 0.0, 0.0,
         0.1, 0.0,
         0.0, 0.1,
         0.1, 0.1,
         0.05, 0.05,
         10.0, 10.0,
         10.1, 10.0,
         10.0, 10.1,
         10.1, 10.1,
         10.05, 10.05;
    if (with_outlier) p.row(10) << 100.0, 100.0;
    return p;
}

} // namespace

// ==========================================
// Core distances
// ==========================================

TEST(HdbscanTest, CoreDistanceCountsThePointItself) {
    Eigen::MatrixXd d(3, 3);
    d << 0.0, 1.0, 3.0,
         1.0, 0.0, 2.0,
         3.0, 2.0, 0.0;
    auto k1 = Hdbscan::core_distances(d, 1);
    EXPECT_EQ(k1, (std::vector<double>{0.0, 0.0, 0.0}));

    auto k2 = Hdbscan::core_distances(d, 2);
    EXPECT_DOUBLE_EQ(k2[0], 1.0);
    EXPECT_DOUBLE_EQ(k2[1], 1.0);
    EXPECT_DOUBLE_EQ(k2[2], 2.0);
}

// ==========================================
// Clustering
// ==========================================

TEST(HdbscanTest, SeparatesTwoBlobs) {
    HdbscanParams params;
    params.min_cluster_size = 3;
    params.min_samples = 2;
    HdbscanResult r = Hdbscan(params).fit(two_blobs(false));

    ASSERT_EQ(r.num_clusters, 2);
    for (int i = 0; i < 10; ++i) {
        EXPECT_GE(r.labels[static_cast<size_t>(i)], 0);
        EXPECT_GE(r.probabilities[static_cast<size_t>(i)], 0.0);
        EXPECT_LE(r.probabilities[static_cast<size_t>(i)], 1.0);
    }
    for (int i = 1; i < 5; ++i) EXPECT_EQ(r.labels[static_cast<size_t>(i)], r.labels[0]);
    for (int i = 6; i < 10; ++i) EXPECT_EQ(r.labels[static_cast<size_t>(i)], r.labels[5]);
    EXPECT_NE(r.labels[0], r.labels[5]);
    EXPECT_FALSE(r.condensed_tree.empty());
}

TEST(HdbscanTest, DistantPointIsNoise) {
    HdbscanParams params;
    params.min_cluster_size = 3;
    params.min_samples = 2;
    HdbscanResult r = Hdbscan(params).fit(two_blobs(true));

    EXPECT_EQ(r.num_clusters, 2);
    EXPECT_EQ(r.labels[10], -1);
    EXPECT_DOUBLE_EQ(r.probabilities[10], 0.0);
}

TEST(HdbscanTest, SingleClusterOnlyWhenAllowed) {
    Eigen::MatrixXd line(6, 1);
    line << 0.0, 1.0, 2.0, 3.0, 4.0, 5.0;

    HdbscanParams params;
    params.min_cluster_size = 3;
    params.min_samples = 2;
    HdbscanResult strict = Hdbscan(params).fit(line);
    EXPECT_EQ(strict.num_clusters, 0);
    for (int label : strict.labels) EXPECT_EQ(label, -1);

    params.allow_single_cluster = true;
    HdbscanResult single = Hdbscan(params).fit(line);
    ASSERT_EQ(single.num_clusters, 1);
    for (int label : single.labels) EXPECT_EQ(label, 0);
}

TEST(HdbscanTest, TooFewPointsAreAllNoise) {
    HdbscanParams params;
    params.min_cluster_size = 5;
    Eigen::MatrixXd p(3, 2);
    p << 0.0, 0.0, 0.1, 0.0, 0.0, 0.1;
    HdbscanResult r = Hdbscan(params).fit(p);
    EXPECT_EQ(r.num_clusters, 0);
    EXPECT_EQ(r.labels, (std::vector<int>{-1, -1, -1}));
}

TEST(HdbscanTest, DeterministicAcrossRuns) {
    HdbscanParams params;
    params.min_cluster_size = 3;
    Eigen::MatrixXd p = two_blobs(true);
    HdbscanResult a = Hdbscan(params).fit(p);
    HdbscanResult b = Hdbscan(params).fit(p);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.probabilities, b.probabilities);
}
