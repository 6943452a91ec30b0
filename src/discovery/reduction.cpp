#include "discovery/reduction.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace nx {

int scaled_components(size_t n, int max_components) {
    int c = static_cast<int>(n / 10);
    return std::max(2, std::min(c, std::max(2, max_components)));
}

int scaled_neighbors(size_t n, int max_neighbors) {
    int k = static_cast<int>(n / 10);
    return std::max(2, std::min(k, std::max(2, max_neighbors)));
}

Eigen::MatrixXd l2_normalize_rows(const std::vector<std::vector<float>>& embeddings) {
    if (embeddings.empty()) {
        return Eigen::MatrixXd();
    }
    const Eigen::Index n = static_cast<Eigen::Index>(embeddings.size());
    const Eigen::Index d = static_cast<Eigen::Index>(embeddings.front().size());

    Eigen::MatrixXd x(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& row = embeddings[static_cast<size_t>(i)];
        if (static_cast<Eigen::Index>(row.size()) != d) {
            throw std::invalid_argument("Embeddings have inconsistent dimensions");
        }
        for (Eigen::Index j = 0; j < d; ++j) {
            x(i, j) = static_cast<double>(row[static_cast<size_t>(j)]);
        }
        double norm = x.row(i).norm();
        if (norm > 0.0) {
            x.row(i) /= norm;
        }
    }
    return x;
}

Eigen::MatrixXd random_projection(const Eigen::MatrixXd& x, int dims, unsigned int seed) {
    std::mt19937 engine(seed);
    std::normal_distribution<double> gaussian(0.0, 1.0 / std::sqrt(static_cast<double>(dims)));

    Eigen::MatrixXd r(x.cols(), dims);
    for (Eigen::Index i = 0; i < r.rows(); ++i) {
        for (Eigen::Index j = 0; j < r.cols(); ++j) {
            r(i, j) = gaussian(engine);
        }
    }
    return x * r;
}

Eigen::MatrixXd pca_scores(const Eigen::MatrixXd& x, int components, double& total_variance) {
    const Eigen::Index n = x.rows();
    Eigen::RowVectorXd mean = x.colwise().mean();
    Eigen::MatrixXd centered = x.rowwise() - mean;

    total_variance = n > 1 ? centered.squaredNorm() / static_cast<double>(n - 1) : 0.0;

    const Eigen::Index k = std::min<Eigen::Index>(components, std::min(n, x.cols()));
    Eigen::MatrixXd scores(n, k);

    if (n <= x.cols()) {
        // Gram matrix: eigenvectors are the score directions
        Eigen::MatrixXd gram = centered * centered.transpose();
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(gram);
        if (solver.info() != Eigen::Success) {
            throw std::runtime_error("Eigendecomposition of the Gram matrix failed");
        }
        // Eigenvalues are sorted ascending
        for (Eigen::Index c = 0; c < k; ++c) {
            Eigen::Index col = n - 1 - c;
            double lambda = std::max(0.0, solver.eigenvalues()(col));
            scores.col(c) = solver.eigenvectors().col(col) * std::sqrt(lambda);
        }
    } else {
        Eigen::MatrixXd cov = centered.transpose() * centered;
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(cov);
        if (solver.info() != Eigen::Success) {
            throw std::runtime_error("Eigendecomposition of the covariance matrix failed");
        }
        const Eigen::Index d = x.cols();
        for (Eigen::Index c = 0; c < k; ++c) {
            scores.col(c) = centered * solver.eigenvectors().col(d - 1 - c);
        }
    }

    for (Eigen::Index c = 0; c < k; ++c) {
        Eigen::Index arg = 0;
        scores.col(c).cwiseAbs().maxCoeff(&arg);
        if (scores(arg, c) < 0.0) {
            scores.col(c) = -scores.col(c);
        }
    }
    return scores;
}

ReductionResult reduce_embeddings(
    const std::vector<std::vector<float>>& embeddings,
    const ReductionConfig& config
) {
    ReductionResult result;
    result.normalized = l2_normalize_rows(embeddings);

    const size_t n = embeddings.size();
    result.neighbors = scaled_neighbors(n, config.max_neighbors);
    if (n < 3) {
        result.points = result.normalized;
        result.components = static_cast<int>(result.normalized.cols());
        return result;
    }

    Eigen::MatrixXd working = result.normalized;
    if (config.projection_threshold > 0 && working.cols() > config.projection_threshold &&
        config.projection_dims > 0 && config.projection_dims < working.cols()) {
        working = random_projection(working, config.projection_dims, config.seed);
    }

    int components = scaled_components(n, config.max_components);
    components = std::min<int>(components, static_cast<int>(n) - 1);
    components = std::min<int>(components, static_cast<int>(working.cols()));

    double variance = 0.0;
    result.points = pca_scores(working, components, variance);
    result.components = static_cast<int>(result.points.cols());
    result.total_variance = variance;
    result.degenerate = variance < config.min_variance;
    return result;
}

} // namespace nx
