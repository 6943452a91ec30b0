#include "discovery/hdbscan.hpp"
#include <algorithm>
#include <deque>
#include <limits>
#include <map>
#include <numeric>
#include <stdexcept>

namespace nx {

namespace {

// Lambda used for zero-distance merges (exact duplicates)
constexpr double kMaxLambda = 1e12;

double to_lambda(double distance) {
    return distance > 1e-12 ? 1.0 / distance : kMaxLambda;
}

struct MstEdge {
    int a;
    int b;
    double weight;
};

class UnionFind {
public:
    explicit UnionFind(size_t size) : parent_(size) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    int find(int x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void attach(int child_root, int new_root) {
        parent_[child_root] = new_root;
    }

private:
    std::vector<int> parent_;
};

} // anonymous namespace

Hdbscan::Hdbscan(const HdbscanParams& params)
    : params_(params) {
    if (params_.min_cluster_size < 2) params_.min_cluster_size = 2;
    if (params_.min_samples < 1) params_.min_samples = 1;
}

Eigen::MatrixXd Hdbscan::pairwise_distances(const Eigen::MatrixXd& points) {
    const Eigen::Index n = points.rows();
    Eigen::MatrixXd d = Eigen::MatrixXd::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = i + 1; j < n; ++j) {
            double dist = (points.row(i) - points.row(j)).norm();
            d(i, j) = dist;
            d(j, i) = dist;
        }
    }
    return d;
}

std::vector<double> Hdbscan::core_distances(const Eigen::MatrixXd& distances, int k) {
    const Eigen::Index n = distances.rows();
    std::vector<double> core(static_cast<size_t>(n), 0.0);
    if (n == 0) return core;

    const size_t rank = static_cast<size_t>(std::min<Eigen::Index>(std::max(k, 1), n)) - 1;
    std::vector<double> row(static_cast<size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            row[static_cast<size_t>(j)] = distances(i, j);
        }
        std::nth_element(row.begin(), row.begin() + static_cast<long>(rank), row.end());
        core[static_cast<size_t>(i)] = row[rank];
    }
    return core;
}

std::vector<Hdbscan::LinkageNode> Hdbscan::single_linkage(
    const Eigen::MatrixXd& distances,
    const std::vector<double>& core
) {
    const int n = static_cast<int>(distances.rows());
    std::vector<MstEdge> edges;
    edges.reserve(static_cast<size_t>(std::max(0, n - 1)));

    std::vector<bool> in_tree(static_cast<size_t>(n), false);
    std::vector<double> best(static_cast<size_t>(n), std::numeric_limits<double>::infinity());
    std::vector<int> from(static_cast<size_t>(n), -1);

    int current = 0;
    for (int step = 0; step + 1 < n; ++step) {
        in_tree[static_cast<size_t>(current)] = true;
        int next = -1;
        for (int j = 0; j < n; ++j) {
            if (in_tree[static_cast<size_t>(j)]) continue;
            double mreach = std::max({core[static_cast<size_t>(current)],
                                      core[static_cast<size_t>(j)],
                                      distances(current, j)});
            if (mreach < best[static_cast<size_t>(j)]) {
                best[static_cast<size_t>(j)] = mreach;
                from[static_cast<size_t>(j)] = current;
            }
            if (next < 0 || best[static_cast<size_t>(j)] < best[static_cast<size_t>(next)]) {
                next = j;
            }
        }
        edges.push_back({from[static_cast<size_t>(next)], next, best[static_cast<size_t>(next)]});
        current = next;
    }

    std::stable_sort(edges.begin(), edges.end(),
                     [](const MstEdge& x, const MstEdge& y) { return x.weight < y.weight; });

    std::vector<LinkageNode> tree(static_cast<size_t>(std::max(1, 2 * n - 1)));
    UnionFind uf(tree.size());
    int next_node = n;
    for (const auto& e : edges) {
        int ra = uf.find(e.a);
        int rb = uf.find(e.b);
        LinkageNode& node = tree[static_cast<size_t>(next_node)];
        node.left = ra;
        node.right = rb;
        node.distance = e.weight;
        node.size = tree[static_cast<size_t>(ra)].size + tree[static_cast<size_t>(rb)].size;
        uf.attach(ra, next_node);
        uf.attach(rb, next_node);
        ++next_node;
    }
    return tree;
}

std::vector<CondensedEdge> Hdbscan::condense(const std::vector<LinkageNode>& tree, int n) const {
    std::vector<CondensedEdge> out;
    if (n < 2) return out;

    const int root = 2 * n - 2;
    const int mcs = params_.min_cluster_size;

    // Breadth-first order over the whole hierarchy
    std::vector<int> order;
    std::deque<int> queue{root};
    while (!queue.empty()) {
        int node = queue.front();
        queue.pop_front();
        order.push_back(node);
        if (node >= n) {
            queue.push_back(tree[static_cast<size_t>(node)].left);
            queue.push_back(tree[static_cast<size_t>(node)].right);
        }
    }

    std::vector<int> relabel(tree.size(), -1);
    std::vector<bool> ignore(tree.size(), false);
    relabel[static_cast<size_t>(root)] = n;
    int next_label = n + 1;

    auto fall_out = [&](int subtree, int parent_label, double lambda) {
        std::vector<int> stack{subtree};
        while (!stack.empty()) {
            int node = stack.back();
            stack.pop_back();
            ignore[static_cast<size_t>(node)] = true;
            if (node < n) {
                out.push_back({parent_label, node, lambda, 1});
            } else {
                stack.push_back(tree[static_cast<size_t>(node)].right);
                stack.push_back(tree[static_cast<size_t>(node)].left);
            }
        }
    };

    for (int node : order) {
        if (node < n || ignore[static_cast<size_t>(node)]) continue;

        const LinkageNode& nd = tree[static_cast<size_t>(node)];
        const int label = relabel[static_cast<size_t>(node)];
        const double lambda = to_lambda(nd.distance);
        const int left_size = tree[static_cast<size_t>(nd.left)].size;
        const int right_size = tree[static_cast<size_t>(nd.right)].size;

        if (left_size >= mcs && right_size >= mcs) {
            relabel[static_cast<size_t>(nd.left)] = next_label++;
            out.push_back({label, relabel[static_cast<size_t>(nd.left)], lambda, left_size});
            relabel[static_cast<size_t>(nd.right)] = next_label++;
            out.push_back({label, relabel[static_cast<size_t>(nd.right)], lambda, right_size});
        } else if (left_size < mcs && right_size < mcs) {
            fall_out(nd.left, label, lambda);
            fall_out(nd.right, label, lambda);
        } else if (left_size < mcs) {
            relabel[static_cast<size_t>(nd.right)] = label;
            fall_out(nd.left, label, lambda);
        } else {
            relabel[static_cast<size_t>(nd.left)] = label;
            fall_out(nd.right, label, lambda);
        }
    }
    return out;
}

std::vector<int> Hdbscan::select_clusters(const std::vector<CondensedEdge>& condensed, int n) const {
    std::map<int, double> birth;
    std::map<int, double> stability;
    std::map<int, std::vector<int>> children;

    birth[n] = 0.0;
    stability[n] = 0.0;
    for (const auto& e : condensed) {
        if (e.child >= n) {
            birth[e.child] = e.lambda;
            stability.emplace(e.child, 0.0);
            children[e.parent].push_back(e.child);
        }
    }
    for (const auto& e : condensed) {
        stability[e.parent] += (e.lambda - birth[e.parent]) * static_cast<double>(e.child_size);
    }

    // Children always carry larger labels than their parent
    std::vector<int> nodes;
    for (const auto& [label, s] : stability) {
        if (label == n && !params_.allow_single_cluster) continue;
        nodes.push_back(label);
    }
    std::sort(nodes.rbegin(), nodes.rend());

    std::map<int, bool> is_cluster;
    for (int node : nodes) is_cluster[node] = true;

    for (int node : nodes) {
        double subtree = 0.0;
        for (int child : children[node]) subtree += stability[child];

        if (subtree > stability[node]) {
            is_cluster[node] = false;
            stability[node] = subtree;
        } else {
            std::vector<int> stack(children[node].begin(), children[node].end());
            while (!stack.empty()) {
                int sub = stack.back();
                stack.pop_back();
                is_cluster[sub] = false;
                for (int c : children[sub]) stack.push_back(c);
            }
        }
    }

    std::vector<int> selected;
    for (const auto& [label, chosen] : is_cluster) {
        if (chosen) selected.push_back(label);
    }
    return selected;
}

HdbscanResult Hdbscan::fit(const Eigen::MatrixXd& points) const {
    const int n = static_cast<int>(points.rows());
    HdbscanResult result;
    result.labels.assign(static_cast<size_t>(n), -1);
    result.probabilities.assign(static_cast<size_t>(n), 0.0);
    if (n < params_.min_cluster_size) {
        return result;
    }

    Eigen::MatrixXd distances = pairwise_distances(points);
    std::vector<double> core = core_distances(distances, params_.min_samples);
    std::vector<LinkageNode> tree = single_linkage(distances, core);
    result.condensed_tree = condense(tree, n);
    std::vector<int> selected = select_clusters(result.condensed_tree, n);

    std::map<int, int> cluster_parent;
    std::vector<int> point_parent(static_cast<size_t>(n), n);
    std::vector<double> point_lambda(static_cast<size_t>(n), 0.0);
    for (const auto& e : result.condensed_tree) {
        if (e.child >= n) {
            cluster_parent[e.child] = e.parent;
        } else {
            point_parent[static_cast<size_t>(e.child)] = e.parent;
            point_lambda[static_cast<size_t>(e.child)] = e.lambda;
        }
    }

    std::map<int, int> cluster_index;
    for (size_t i = 0; i < selected.size(); ++i) {
        cluster_index[selected[i]] = static_cast<int>(i);
    }

    for (int p = 0; p < n; ++p) {
        int c = point_parent[static_cast<size_t>(p)];
        while (true) {
            auto hit = cluster_index.find(c);
            if (hit != cluster_index.end()) {
                result.labels[static_cast<size_t>(p)] = hit->second;
                break;
            }
            auto up = cluster_parent.find(c);
            if (up == cluster_parent.end()) break;
            c = up->second;
        }
    }

    // Membership strength relative to the densest member of each cluster
    std::vector<double> max_lambda(selected.size(), 0.0);
    for (int p = 0; p < n; ++p) {
        int label = result.labels[static_cast<size_t>(p)];
        double lambda = point_lambda[static_cast<size_t>(p)];
        if (label >= 0 && lambda < kMaxLambda) {
            max_lambda[static_cast<size_t>(label)] = std::max(max_lambda[static_cast<size_t>(label)], lambda);
        }
    }
    for (int p = 0; p < n; ++p) {
        int label = result.labels[static_cast<size_t>(p)];
        if (label < 0) continue;
        double lambda = point_lambda[static_cast<size_t>(p)];
        double top = max_lambda[static_cast<size_t>(label)];
        if (lambda >= kMaxLambda || top <= 0.0) {
            result.probabilities[static_cast<size_t>(p)] = 1.0;
        } else {
            result.probabilities[static_cast<size_t>(p)] = std::min(lambda, top) / top;
        }
    }

    result.num_clusters = static_cast<int>(selected.size());
    return result;
}

} // namespace nx
