#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace nx {

/**
 * @brief Parameters of the embedding reduction step
 */
struct ReductionConfig {
    int max_components = 5;                 ///< Upper bound on PCA output dimensions
    int max_neighbors = 15;                 ///< Upper bound on the neighbourhood size
    int projection_threshold = 256;         ///< Random projection above this input dimension
    int projection_dims = 64;               ///< Target dimension of the random projection
    unsigned int seed = 42;                 ///< Random projection seed
    double min_variance = 1e-10;            ///< Below this total variance the batch is degenerate
};

/**
 * @brief Output of reduce_embeddings
 */
struct ReductionResult {
    Eigen::MatrixXd normalized;             ///< n x d, L2-normalised input rows
    Eigen::MatrixXd points;                 ///< n x components, reduced coordinates
    int components = 0;
    int neighbors = 0;
    double total_variance = 0.0;
    bool degenerate = false;                ///< Identical or near-duplicate embeddings
};

/// clamp(n / 10, 2, max_components)
int scaled_components(size_t n, int max_components);

/// clamp(n / 10, 2, max_neighbors)
int scaled_neighbors(size_t n, int max_neighbors);

/// Copies embeddings into a matrix with each row scaled to unit length (zero rows stay zero).
Eigen::MatrixXd l2_normalize_rows(const std::vector<std::vector<float>>& embeddings);

/**
 * @brief Seeded Gaussian random projection to `dims` columns
 *
 * The same seed, input dimension and target dimension always produce the
 * same projection matrix.
 */
Eigen::MatrixXd random_projection(const Eigen::MatrixXd& x, int dims, unsigned int seed);

/**
 * @brief PCA scores of the centred rows of x
 *
 * Eigen-decomposes the smaller of the Gram and covariance matrices. Each
 * component's sign is fixed so its largest-magnitude score is positive.
 *
 * @param total_variance Receives the summed variance of the centred data
 */
Eigen::MatrixXd pca_scores(const Eigen::MatrixXd& x, int components, double& total_variance);

/**
 * @brief Normalise, optionally project, then PCA-reduce a batch of embeddings
 *
 * All rows must share one dimension. Output dimension and neighbourhood size
 * scale with the batch size.
 */
ReductionResult reduce_embeddings(
    const std::vector<std::vector<float>>& embeddings,
    const ReductionConfig& config
);

} // namespace nx
