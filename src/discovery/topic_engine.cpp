#include "discovery/topic_engine.hpp"
#include "discovery/hdbscan.hpp"
#include "discovery/topic_labeler.hpp"
#include "model/analysis.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace nx {

namespace {

Eigen::RowVectorXd centroid_of(const Eigen::MatrixXd& points, const std::vector<size_t>& rows) {
    Eigen::RowVectorXd c = Eigen::RowVectorXd::Zero(points.cols());
    for (size_t r : rows) c += points.row(static_cast<Eigen::Index>(r));
    if (!rows.empty()) c /= static_cast<double>(rows.size());
    return c;
}

double median_size(const std::vector<std::vector<size_t>>& clusters) {
    std::vector<size_t> sizes;
    for (const auto& c : clusters) sizes.push_back(c.size());
    std::sort(sizes.begin(), sizes.end());
    size_t mid = sizes.size() / 2;
    if (sizes.size() % 2 == 0) {
        return (static_cast<double>(sizes[mid - 1]) + static_cast<double>(sizes[mid])) / 2.0;
    }
    return static_cast<double>(sizes[mid]);
}

} // anonymous namespace

TopicDiscoveryEngine::TopicDiscoveryEngine(const DiscoveryConfig& config)
    : config_(config) {}

double TopicDiscoveryEngine::raw_relevance(int size, int largest_size, double confidence) {
    if (largest_size <= 0) return 0.0;
    double c = std::max(0.0, std::min(1.0, confidence));
    return (static_cast<double>(size) / static_cast<double>(largest_size)) * (0.6 + 0.4 * c);
}

void TopicDiscoveryEngine::rank_topics(std::vector<DiscoveredTopic>& topics) {
    std::stable_sort(topics.begin(), topics.end(), [](const DiscoveredTopic& a, const DiscoveredTopic& b) {
        if (a.relevance != b.relevance) return a.relevance > b.relevance;
        if (a.cluster_size != b.cluster_size) return a.cluster_size > b.cluster_size;
        return a.title < b.title;
    });
}

// ============================================================================
// Clustering Steps
// ============================================================================

std::vector<TopicDiscoveryEngine::Cluster> TopicDiscoveryEngine::cluster_points(
    const Eigen::MatrixXd& points,
    int min_cluster_size,
    int min_samples,
    std::vector<double>& membership
) const {
    HdbscanParams params;
    params.min_cluster_size = min_cluster_size;
    params.min_samples = min_samples;

    HdbscanResult fit = Hdbscan(params).fit(points);
    if (fit.num_clusters == 0) {
        log::info(config_.verbose, "discovery", "No clusters selected, retrying with a single root cluster allowed");
        params.allow_single_cluster = true;
        fit = Hdbscan(params).fit(points);
    }

    std::vector<Cluster> clusters(static_cast<size_t>(fit.num_clusters));
    size_t noise = 0;
    for (size_t i = 0; i < fit.labels.size(); ++i) {
        if (fit.labels[i] < 0) {
            ++noise;
            continue;
        }
        clusters[static_cast<size_t>(fit.labels[i])].push_back(i);
        membership[i] = fit.probabilities[i];
    }
    log::info(config_.verbose, "discovery",
              "Found " + std::to_string(clusters.size()) + " clusters, " +
              std::to_string(noise) + " noise points");
    return clusters;
}

void TopicDiscoveryEngine::merge_to_target(
    std::vector<Cluster>& clusters,
    const Eigen::MatrixXd& points,
    int target
) const {
    while (static_cast<int>(clusters.size()) > target && clusters.size() > 1) {
        std::vector<Eigen::RowVectorXd> centroids;
        for (const auto& c : clusters) centroids.push_back(centroid_of(points, c));

        size_t best_i = 0;
        size_t best_j = 1;
        double best = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < clusters.size(); ++i) {
            for (size_t j = i + 1; j < clusters.size(); ++j) {
                double d = (centroids[i] - centroids[j]).norm();
                if (d < best) {
                    best = d;
                    best_i = i;
                    best_j = j;
                }
            }
        }

        clusters[best_i].insert(clusters[best_i].end(), clusters[best_j].begin(), clusters[best_j].end());
        std::sort(clusters[best_i].begin(), clusters[best_i].end());
        clusters.erase(clusters.begin() + static_cast<long>(best_j));
    }
}

void TopicDiscoveryEngine::split_oversized(
    std::vector<Cluster>& clusters,
    const std::vector<std::vector<float>>& embeddings,
    int min_cluster_size,
    int min_samples,
    std::optional<int> target
) const {
    const int sub_min_samples = std::max(1, min_samples / 2);

    for (int depth = 0; depth < config_.max_subcluster_depth; ++depth) {
        if (clusters.size() < 2) return;

        const double median = median_size(clusters);
        size_t total = clusters.size();
        bool changed = false;
        std::vector<Cluster> next;

        for (const auto& cluster : clusters) {
            const bool oversized = static_cast<double>(cluster.size()) > config_.oversize_factor * median &&
                                   cluster.size() >= static_cast<size_t>(2 * min_cluster_size);
            if (!oversized || (target && static_cast<int>(total) + 1 > *target)) {
                next.push_back(cluster);
                continue;
            }

            std::vector<std::vector<float>> sub_embeddings;
            for (size_t r : cluster) sub_embeddings.push_back(embeddings[r]);
            ReductionResult reduced = reduce_embeddings(sub_embeddings, config_.reduction);
            if (reduced.degenerate) {
                next.push_back(cluster);
                continue;
            }

            HdbscanParams params;
            params.min_cluster_size = min_cluster_size;
            params.min_samples = sub_min_samples;
            HdbscanResult fit = Hdbscan(params).fit(reduced.points);

            const int allowed = target ? *target - static_cast<int>(total) + 1 : fit.num_clusters;
            if (fit.num_clusters < 2 || fit.num_clusters > allowed) {
                next.push_back(cluster);
                continue;
            }

            std::vector<Cluster> local(static_cast<size_t>(fit.num_clusters));
            std::vector<size_t> noise;
            for (size_t i = 0; i < fit.labels.size(); ++i) {
                if (fit.labels[i] < 0) noise.push_back(i);
                else local[static_cast<size_t>(fit.labels[i])].push_back(i);
            }

            // Noise inside a split joins the nearest sub-cluster
            std::vector<Eigen::RowVectorXd> centroids;
            for (const auto& l : local) centroids.push_back(centroid_of(reduced.points, l));
            for (size_t p : noise) {
                size_t nearest = 0;
                double best = std::numeric_limits<double>::infinity();
                for (size_t c = 0; c < centroids.size(); ++c) {
                    double d = (reduced.points.row(static_cast<Eigen::Index>(p)) - centroids[c]).norm();
                    if (d < best) {
                        best = d;
                        nearest = c;
                    }
                }
                local[nearest].push_back(p);
            }

            bool valid = std::all_of(local.begin(), local.end(), [&](const Cluster& l) {
                return l.size() >= static_cast<size_t>(min_cluster_size);
            });
            if (!valid) {
                next.push_back(cluster);
                continue;
            }

            for (auto& l : local) {
                Cluster mapped;
                for (size_t i : l) mapped.push_back(cluster[i]);
                std::sort(mapped.begin(), mapped.end());
                next.push_back(std::move(mapped));
            }
            total += local.size() - 1;
            changed = true;
            log::info(config_.verbose, "discovery",
                      "Split cluster of " + std::to_string(cluster.size()) + " into " +
                      std::to_string(local.size()) + " sub-clusters (depth " + std::to_string(depth + 1) + ")");
        }

        clusters = std::move(next);
        if (!changed) return;
    }
}

// ============================================================================
// Discovery
// ============================================================================

DiscoveryResult TopicDiscoveryEngine::discover(const DiscoveryRequest& request) const {
    DiscoveryResult result;
    result.query = request.query;

    const int min_cluster_size = request.min_cluster_size.value_or(config_.min_cluster_size);
    if (min_cluster_size < 1) {
        throw DiscoveryFailure("min_cluster_size must be at least 1");
    }
    if (request.target_topic_count && *request.target_topic_count < 1) {
        throw DiscoveryFailure("Target topic count must be at least 1");
    }

    // Preparation
    std::vector<size_t> usable;
    std::vector<std::vector<float>> embeddings;
    size_t dim = 0;
    for (size_t i = 0; i < request.documents.size(); ++i) {
        const auto& emb = request.documents[i].embedding;
        if (emb.empty()) continue;
        if (dim == 0) {
            dim = emb.size();
        } else if (emb.size() != dim) {
            throw DiscoveryFailure("Embedding dimension mismatch for document '" +
                                   request.documents[i].id + "': expected " + std::to_string(dim) +
                                   ", got " + std::to_string(emb.size()));
        }
        usable.push_back(i);
        embeddings.push_back(emb);
    }
    result.total_articles_processed = static_cast<int>(usable.size());

    const size_t n = usable.size();
    if (n == 0 || n < static_cast<size_t>(min_cluster_size)) {
        log::info(config_.verbose, "discovery",
                  std::to_string(n) + " usable documents, fewer than min_cluster_size " +
                  std::to_string(min_cluster_size) + "; no topics");
        return result;
    }

    // Reduction and clustering
    ReductionResult reduced;
    try {
        reduced = reduce_embeddings(embeddings, config_.reduction);
    } catch (const std::exception& e) {
        throw DiscoveryFailure(std::string("Dimensionality reduction failed: ") + e.what());
    }

    std::vector<double> membership(n, 1.0);
    std::vector<Cluster> clusters;
    if (n < 3 || reduced.degenerate) {
        log::info(config_.verbose, "discovery", "Degenerate batch, using a single cluster");
        Cluster all(n);
        std::iota(all.begin(), all.end(), 0);
        clusters.push_back(std::move(all));
    } else {
        const int effective_mcs = std::max(2, min_cluster_size);
        const int min_samples = config_.min_samples.value_or(std::min(effective_mcs, reduced.neighbors));
        log::info(config_.verbose, "discovery",
                  "Clustering " + std::to_string(n) + " documents in " +
                  std::to_string(reduced.components) + " dimensions (min_cluster_size=" +
                  std::to_string(effective_mcs) + ", min_samples=" + std::to_string(min_samples) + ")");

        clusters = cluster_points(reduced.points, effective_mcs, min_samples, membership);
        if (request.target_topic_count && static_cast<int>(clusters.size()) > *request.target_topic_count) {
            merge_to_target(clusters, reduced.points, *request.target_topic_count);
        }
        split_oversized(clusters, embeddings, effective_mcs, min_samples, request.target_topic_count);
    }

    clusters.erase(std::remove_if(clusters.begin(), clusters.end(), [&](const Cluster& c) {
        return c.size() < static_cast<size_t>(min_cluster_size);
    }), clusters.end());
    if (clusters.empty()) {
        return result;
    }

    // Largest first so the biggest topic keeps an undecorated title
    std::stable_sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        return a.size() > b.size();
    });

    std::vector<LabelDocument> corpus;
    for (size_t idx : usable) {
        corpus.push_back({request.documents[idx].title, request.documents[idx].summary});
    }
    TopicLabeler labeler(std::move(corpus), request.query);

    std::vector<DiscoveredTopic> topics;
    std::vector<TopicLabel> labels;
    int largest = 0;
    for (const auto& c : clusters) largest = std::max(largest, static_cast<int>(c.size()));

    for (const auto& cluster : clusters) {
        DiscoveredTopic topic;
        topic.id = generate_uuid();
        topic.cluster_size = static_cast<int>(cluster.size());

        Eigen::RowVectorXd centroid = centroid_of(reduced.normalized, cluster);
        double norm = centroid.norm();
        if (norm > 0.0) centroid /= norm;

        std::vector<std::pair<double, size_t>> by_centrality;
        double cosine_sum = 0.0;
        double membership_sum = 0.0;
        for (size_t r : cluster) {
            double cosine = reduced.normalized.row(static_cast<Eigen::Index>(r)).dot(centroid);
            cosine_sum += cosine;
            membership_sum += membership[r];
            by_centrality.emplace_back(cosine, r);
        }
        std::stable_sort(by_centrality.begin(), by_centrality.end(), [](const auto& a, const auto& b) {
            if (a.first != b.first) return a.first > b.first;
            return a.second < b.second;
        });

        topic.cohesion = std::max(0.0, std::min(1.0, cosine_sum / static_cast<double>(cluster.size())));
        topic.membership = std::max(0.0, std::min(1.0, membership_sum / static_cast<double>(cluster.size())));

        std::vector<size_t> ordered;
        for (const auto& entry : by_centrality) ordered.push_back(entry.second);
        labels.push_back(labeler.label(ordered));

        // The cap never drops a topic below min_cluster_size members
        const size_t cap = config_.max_articles_per_topic > 0
                               ? std::min(ordered.size(), static_cast<size_t>(
                                     std::max(config_.max_articles_per_topic, min_cluster_size)))
                               : ordered.size();
        for (size_t i = 0; i < cap; ++i) topic.members.push_back(usable[ordered[i]]);

        topic.centroid.reserve(static_cast<size_t>(centroid.size()));
        for (Eigen::Index k = 0; k < centroid.size(); ++k) topic.centroid.push_back(static_cast<float>(centroid(k)));

        topics.push_back(std::move(topic));
    }

    TopicLabeler::disambiguate(labels);

    // Relevance
    std::vector<double> raw(topics.size(), 0.0);
    double max_raw = 0.0;
    for (size_t i = 0; i < topics.size(); ++i) {
        double confidence = 0.5 * topics[i].cohesion + 0.5 * topics[i].membership;
        raw[i] = raw_relevance(topics[i].cluster_size, largest, confidence);
        max_raw = std::max(max_raw, raw[i]);
    }
    for (size_t i = 0; i < topics.size(); ++i) {
        topics[i].title = labels[i].title;
        topics[i].description = labels[i].description;
        topics[i].keywords = labels[i].keywords;
        int relevance = max_raw > 0.0 ? static_cast<int>(std::lround(100.0 * raw[i] / max_raw)) : 0;
        topics[i].relevance = std::max(0, std::min(100, relevance));
    }

    rank_topics(topics);
    result.topics = std::move(topics);

    log::info(config_.verbose, "discovery",
              "Discovered " + std::to_string(result.topics.size()) + " topics from " +
              std::to_string(n) + " documents");
    return result;
}

} // namespace nx
