#pragma once

#include <Eigen/Dense>
#include <vector>

namespace nx {

/**
 * @brief HDBSCAN parameters
 */
struct HdbscanParams {
    int min_cluster_size = 2;               ///< Smallest cluster kept in the condensed tree (>= 2)
    int min_samples = 2;                    ///< Neighbour rank used for core distances (self included)
    bool allow_single_cluster = false;      ///< Let the root itself be selected
};

/**
 * @brief One edge of the condensed cluster tree
 *
 * Children below the number of points are points falling out of `parent`;
 * larger ids are clusters.
 */
struct CondensedEdge {
    int parent = 0;
    int child = 0;
    double lambda = 0.0;                    ///< 1 / distance at which the child leaves
    int child_size = 1;
};

struct HdbscanResult {
    std::vector<int> labels;                ///< Cluster index per point, -1 for noise
    std::vector<double> probabilities;      ///< Membership strength in [0, 1], 0 for noise
    int num_clusters = 0;
    std::vector<CondensedEdge> condensed_tree;
};

/**
 * @brief Hierarchical density-based clustering with excess-of-mass selection
 *
 * Euclidean metric, mutual reachability distances, Prim minimum spanning
 * tree, single-linkage hierarchy, condensed tree, stability-based cluster
 * selection. Deterministic: ties resolve by point index.
 */
class Hdbscan {
public:
    explicit Hdbscan(const HdbscanParams& params);

    HdbscanResult fit(const Eigen::MatrixXd& points) const;

    /// Distance to the k-th nearest neighbour, counting the point itself.
    static std::vector<double> core_distances(const Eigen::MatrixXd& distances, int k);

private:
    struct LinkageNode {
        int left = -1;
        int right = -1;
        double distance = 0.0;
        int size = 1;
    };

    HdbscanParams params_;

    static Eigen::MatrixXd pairwise_distances(const Eigen::MatrixXd& points);

    /// Prim's algorithm over the dense mutual reachability graph.
    static std::vector<LinkageNode> single_linkage(
        const Eigen::MatrixXd& distances,
        const std::vector<double>& core
    );

    std::vector<CondensedEdge> condense(const std::vector<LinkageNode>& tree, int n) const;

    std::vector<int> select_clusters(const std::vector<CondensedEdge>& condensed, int n) const;
};

} // namespace nx
